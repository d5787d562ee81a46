#pragma once

#include "vqeval/core/Evaluator.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace vqeval {

class EvalClient {
public:
    struct Options {
        int  deadlineMs        = 0;      // per call, 0 = no deadline
        bool waitForReady      = true;   // queue the call while the channel connects
    };

    /* What to evaluate; zero / false fields leave the server default. */
    struct Request {
        std::string referencePath;
        std::string candidatePath;
        std::size_t maxSamples   = 0;
        bool        exhaustive   = false;
        int         targetWidth  = 0;
        int         targetHeight = 0;
        bool        nativeSize   = false;
        int         ssimWindow   = 0;
    };

    explicit EvalClient(const std::string& serverAddr);     // constructor with default options
    EvalClient(const std::string& serverAddr, Options opt); // constructor with custom options
    ~EvalClient();

    // Unary call. A failed evaluation is rethrown as EvalError with the
    // server's kind; transport failures as std::runtime_error.
    EvaluationResult evaluate(const Request& req);

    // Streaming call; onSample sees every compared pair as the server scores it.
    EvaluationResult evaluateStream(const Request& req, const SampleObserver& onSample);

    EvalClient(const EvalClient&)            = delete;
    EvalClient& operator=(const EvalClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vqeval
