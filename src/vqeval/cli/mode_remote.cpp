#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "vqeval/core/Errors.hpp"
#include "vqeval/io/EvalClient.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>

int run_remote(int argc, char** argv) {
    const std::string server = argValue(argc, argv, "server", "localhost:50061");
    const std::string ref    = argValue(argc, argv, "ref", "");
    const std::string cand   = argValue(argc, argv, "cand", "");
    const bool stream        = argHas(argc, argv, "stream");

    if (ref.empty() || cand.empty()) {
        std::cerr << "[remote] usage: vqeval-cli remote --server=HOST:PORT --ref=REF --cand=CAND [--stream]\n"
                  << "[remote] paths are resolved on the server host.\n";
        return 1;
    }

    try {
        vqeval::EvalClient::Request rq{};
        rq.referencePath = ref;
        rq.candidatePath = cand;
        rq.maxSamples    = static_cast<std::size_t>(std::max(0, argValueInt(argc, argv, "samples", 0)));
        rq.exhaustive    = argHas(argc, argv, "exhaustive");
        rq.ssimWindow    = argValueInt(argc, argv, "window", 0);
        const std::string size = argValue(argc, argv, "size", "");
        if (size == "native") {
            rq.nativeSize = true;
        } else if (!size.empty() && !parse_size(size, rq.targetWidth, rq.targetHeight)) {
            throw std::invalid_argument("--size: expected WxH or 'native', got '" + size + "'");
        }

        vqeval::EvalClient::Options co{};
        co.deadlineMs = std::max(0, argValueInt(argc, argv, "deadline", 0));
        vqeval::EvalClient client(server, co);

        std::cout << "[remote] server=" << server << (stream ? ", streaming" : "") << "\n";

        vqeval::EvaluationResult r{};
        if (stream) {
            r = client.evaluateStream(rq, [](const vqeval::MetricSample& s) {
                std::cout << "[remote]   frame " << std::setw(6) << s.index
                          << "  psnr=" << std::fixed << std::setprecision(2) << s.psnr
                          << "  ssim=" << std::setprecision(4) << s.ssim
                          << std::defaultfloat << "\n";
            });
        } else {
            r = client.evaluate(rq);
        }
        print_result(std::cout, cand, r);
    } catch (const vqeval::EvalError& e) {
        std::cerr << "[remote] " << vqeval::toString(e.kind()) << ": " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[remote] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
