#pragma once

#include "vqeval/core/Config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace vqeval {

class EvalServer {
public:
    struct Options {
        int         maxConcurrent = 2;      // evaluations running at once; more get RESOURCE_EXHAUSTED
        std::size_t workerThreads = 0;      // metric workers per evaluation
        EvalConfig  defaults{};             // used for fields the request leaves unset
        int         monitorMs     = 5000;   // period of the activity log, 0 = off
    };

    explicit EvalServer(std::uint16_t port = 50061);            // default options
    EvalServer(std::uint16_t port, Options opt);                // custom options
    ~EvalServer();

    // Actual listening port (useful when constructed with port 0).
    int port() const;

    // Blocks until shutdown() is called from another thread.
    void wait();
    void shutdown();

    EvalServer(const EvalServer&)            = delete;
    EvalServer& operator=(const EvalServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> p_;
};

} // namespace vqeval
