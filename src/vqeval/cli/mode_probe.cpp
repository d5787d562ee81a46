#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "vqeval/io/SourceFactory.hpp"

#include <iostream>
#include <string>

int run_probe(int argc, char** argv) {
    const std::string file = argValue(argc, argv, "file", "");
    if (file.empty()) {
        std::cerr << "[probe] usage: vqeval-cli probe --file=PATH\n";
        return 1;
    }

    try {
        auto src = vqeval::openSource(file);
        print_info(std::cout, src->info());
    } catch (const std::exception& e) {
        std::cerr << "[probe] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
