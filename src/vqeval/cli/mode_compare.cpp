// src/vqeval/cli/mode_compare.cpp
#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "vqeval/core/Backend.hpp"
#include "vqeval/core/Errors.hpp"
#include "vqeval/core/Evaluator.hpp"
#include "vqeval/io/SourceFactory.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int run_compare(int argc, char** argv)
{
    const std::string refPath = argValue(argc, argv, "ref", "");
    const auto cands          = splitList(argValue(argc, argv, "cand", ""));
    const auto labels         = splitList(argValue(argc, argv, "labels", ""));
    const bool verbose        = argHas(argc, argv, "verbose");

    if (refPath.empty() || cands.empty()) {
        std::cerr
            << "[compare] usage:\n"
            << "  vqeval-cli compare --ref=orig.mp4 --cand=a.mp4[,b.avi,...] [--labels=A,B,...]\n";
        return 1;
    }

    vqeval::EvalConfig cfg{};
    try {
        cfg = config_from_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[compare] error: " << e.what() << '\n';
        return 1;
    }

    std::cout << "[compare] reference=" << refPath << ", candidates=" << cands.size()
              << ", samples=" << (cfg.maxSamples == 0 ? std::string("all") : std::to_string(cfg.maxSamples))
              << ", size=" << (cfg.keepNativeSize() ? std::string("native")
                                                    : std::to_string(cfg.targetWidth) + "x" + std::to_string(cfg.targetHeight))
              << ", window=" << cfg.ssimWindow
              << ", threads=" << cfg.workerThreads << "\n\n";

    auto backend = vqeval::makeBackend(cfg.backend);
    vqeval::Evaluator ev(*backend, cfg);
    if (verbose) {
        ev.setObserver([](const vqeval::MetricSample& s) {
            std::cout << "[compare]   frame " << std::setw(6) << s.index
                      << "  psnr=" << std::fixed << std::setprecision(2) << s.psnr
                      << "  ssim=" << std::setprecision(4) << s.ssim
                      << std::defaultfloat << "\n";
        });
    }

    int failures = 0;
    for (std::size_t i = 0; i < cands.size(); ++i) {
        const std::string& candPath = cands[i];
        const std::string label = (i < labels.size())
            ? labels[i]
            : std::filesystem::path(candPath).filename().string();

        try {
            // reopen the reference per candidate: each evaluation owns its handles
            auto ref  = vqeval::openSource(refPath);
            auto cand = vqeval::openSource(candPath);

            const auto t0 = std::chrono::steady_clock::now();
            const vqeval::EvaluationResult r = ev.evaluate(*ref, *cand);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0).count();

            print_result(std::cout, label, r);
            std::cout << "(" << ms << " ms)\n\n";
        } catch (const vqeval::EvalError& e) {
            std::cerr << "[compare] " << label << ": " << vqeval::toString(e.kind())
                      << ": " << e.what() << "\n";
            ++failures;
        } catch (const std::exception& e) {
            std::cerr << "[compare] " << label << ": error: " << e.what() << '\n';
            ++failures;
        }
    }

    return failures == 0 ? 0 : 1;
}
