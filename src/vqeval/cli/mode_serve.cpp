#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "vqeval/io/EvalServer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

int run_serve(int argc, char** argv) {
    try {
        const int port = argValueInt(argc, argv, "port", 50061);
        if (port < 0 || port > 65535) throw std::invalid_argument("--port out of range");

        vqeval::EvalServer::Options so{};
        so.maxConcurrent = std::max(1, argValueInt(argc, argv, "max-concurrent", 2));
        so.defaults      = config_from_args(argc, argv);
        so.workerThreads = so.defaults.workerThreads;
        so.monitorMs     = std::max(0, argValueInt(argc, argv, "monitor", 5000));

        std::cout << "[serve] starting...\n";
        std::cout << "[serve] port=" << port << ", max-concurrent=" << so.maxConcurrent
                  << ", threads=" << so.workerThreads << "\n";

        vqeval::EvalServer server(static_cast<std::uint16_t>(port), so);

        std::thread waiter([&server]{ server.wait(); });
        std::cout << "[serve] press Enter to stop.\n";
        std::cin.get();
        server.shutdown();
        waiter.join();

        std::cout << "[serve] stopped.\n";
    } catch (const std::exception& e) {
        std::cerr << "[serve] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
