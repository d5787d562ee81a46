#include "vqeval/io/EvalClient.hpp"
#include "vqeval/core/Errors.hpp"
#include "vqeval.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace vqeval {

namespace {
/* Fill the protobuf request from the plain struct. */
static EvaluateRequest to_pb(const EvalClient::Request& r) {
    EvaluateRequest pb;
    pb.set_reference_path(r.referencePath);
    pb.set_candidate_path(r.candidatePath);
    pb.set_max_samples(static_cast<std::uint32_t>(r.maxSamples));
    pb.set_exhaustive(r.exhaustive);
    pb.set_target_width(static_cast<std::uint32_t>(std::max(0, r.targetWidth)));
    pb.set_target_height(static_cast<std::uint32_t>(std::max(0, r.targetHeight)));
    pb.set_native_size(r.nativeSize);
    pb.set_ssim_window(static_cast<std::uint32_t>(std::max(0, r.ssimWindow)));
    return pb;
}

/* Turn a reply into a result, or throw what the server reported. */
static EvaluationResult from_pb(const EvaluateReply& reply) {
    if (!reply.ok()) {
        const std::string msg = reply.message();
        switch (reply.error()) {
            case ErrorKindPB::ERROR_KIND_SOURCE_UNAVAILABLE:
                throw EvalError(ErrorKind::SourceUnavailable, msg);
            case ErrorKindPB::ERROR_KIND_EMPTY_SOURCE:
                throw EvalError(ErrorKind::EmptySource, msg);
            case ErrorKindPB::ERROR_KIND_NO_COMPARABLE_PAIRS:
                throw EvalError(ErrorKind::NoComparablePairs, msg);
            case ErrorKindPB::ERROR_KIND_CANCELLED:
                throw EvalError(ErrorKind::Cancelled, msg);
            case ErrorKindPB::ERROR_KIND_INVALID_ARGUMENT:
                throw std::invalid_argument(msg);
            default:
                throw std::runtime_error("remote evaluation failed: " + msg);
        }
    }

    EvaluationResult res{};
    res.meanPsnr = reply.mean_psnr();
    res.meanSsim = reply.mean_ssim();
    res.count    = static_cast<std::size_t>(reply.count());
    res.planned  = static_cast<std::size_t>(reply.planned());
    return res;
}

static std::runtime_error transportError(const grpc::Status& st) {
    return std::runtime_error("rpc failed (" + std::to_string(static_cast<int>(st.error_code())) +
                              "): " + st.error_message());
}
} // namespace

class EvalClient::Impl {
public:
    Impl(const std::string& addr, Options opt)
        : serverAddr_{addr}, opt_{opt}
    {
        channel_ = grpc::CreateChannel(serverAddr_, grpc::InsecureChannelCredentials());
        stub_ = VqEval::NewStub(channel_);
    }

    EvaluationResult evaluate(const Request& req) {
        grpc::ClientContext ctx;
        prepare(ctx);

        EvaluateReply reply;
        const grpc::Status st = stub_->Evaluate(&ctx, to_pb(req), &reply);
        if (!st.ok()) throw transportError(st);
        return from_pb(reply);
    }

    EvaluationResult evaluateStream(const Request& req, const SampleObserver& onSample) {
        grpc::ClientContext ctx;
        prepare(ctx);

        auto reader = stub_->EvaluateStream(&ctx, to_pb(req));

        EvaluateUpdate u;
        EvaluateReply  last;
        bool haveResult = false;
        while (reader->Read(&u)) {
            if (u.has_sample()) {
                if (onSample) {
                    MetricSample s{};
                    s.index = static_cast<std::size_t>(u.sample().index());
                    s.psnr  = u.sample().psnr();
                    s.ssim  = u.sample().ssim();
                    onSample(s);
                }
            } else if (u.has_result()) {
                last = u.result();
                haveResult = true;
            }
        }

        const grpc::Status st = reader->Finish();
        if (!st.ok()) throw transportError(st);
        if (!haveResult) throw std::runtime_error("stream ended without a result");
        return from_pb(last);
    }

private:
    void prepare(grpc::ClientContext& ctx) const {
        ctx.set_wait_for_ready(opt_.waitForReady);
        if (opt_.deadlineMs > 0) {
            ctx.set_deadline(std::chrono::system_clock::now() +
                             std::chrono::milliseconds(opt_.deadlineMs));
        }
    }

    std::string serverAddr_;
    Options     opt_;

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<VqEval::Stub> stub_;
};

EvalClient::EvalClient(const std::string& serverAddr)
    : pimpl_{std::make_unique<Impl>(serverAddr, Options{})} {}

EvalClient::EvalClient(const std::string& serverAddr, Options opt)
    : pimpl_{std::make_unique<Impl>(serverAddr, opt)} {}

EvalClient::~EvalClient() = default;

EvaluationResult EvalClient::evaluate(const Request& req) { return pimpl_->evaluate(req); }

EvaluationResult EvalClient::evaluateStream(const Request& req, const SampleObserver& onSample) {
    return pimpl_->evaluateStream(req, onSample);
}

} // namespace vqeval
