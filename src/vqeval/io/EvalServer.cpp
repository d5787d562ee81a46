#include "vqeval/io/EvalServer.hpp"
#include "vqeval/core/Backend.hpp"
#include "vqeval/core/Errors.hpp"
#include "vqeval/core/Evaluator.hpp"
#include "vqeval/core/QualityBands.hpp"
#include "vqeval/io/SourceFactory.hpp"
#include "vqeval.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace vqeval {

//------------------------------------------------------------------------------
// Small helpers (enum mapping, request -> config)
//------------------------------------------------------------------------------
namespace {
static ErrorKindPB to_pb(ErrorKind k) {
    switch (k) {
        case ErrorKind::SourceUnavailable: return ErrorKindPB::ERROR_KIND_SOURCE_UNAVAILABLE;
        case ErrorKind::EmptySource:       return ErrorKindPB::ERROR_KIND_EMPTY_SOURCE;
        case ErrorKind::NoComparablePairs: return ErrorKindPB::ERROR_KIND_NO_COMPARABLE_PAIRS;
        case ErrorKind::Cancelled:         return ErrorKindPB::ERROR_KIND_CANCELLED;
        default:                           return ErrorKindPB::ERROR_KIND_INTERNAL;
    }
}

static EvalConfig configFrom(const EvaluateRequest& req, const EvalConfig& defaults,
                             std::size_t workerThreads)
{
    EvalConfig cfg = defaults;
    cfg.workerThreads = workerThreads;
    if (req.exhaustive())            cfg.maxSamples = 0;
    else if (req.max_samples() > 0)  cfg.maxSamples = req.max_samples();
    if (req.native_size()) {
        cfg.targetWidth = cfg.targetHeight = 0;
    } else if (req.target_width() > 0 || req.target_height() > 0) {
        cfg.targetWidth  = static_cast<int>(req.target_width());
        cfg.targetHeight = static_cast<int>(req.target_height());
    }
    if (req.ssim_window() > 0) cfg.ssimWindow = static_cast<int>(req.ssim_window());
    return cfg;
}
} // namespace

//------------------------------------------------------------------------------
// gRPC evaluation service
//  - each call opens its own pair of sources and runs one Evaluator
//  - at most opt.maxConcurrent calls evaluate at the same time
//  - fatal evaluation errors come back as ok=false replies with a kind,
//    never as a zeroed result
//  - a cancelled call stops at the next sample boundary
//------------------------------------------------------------------------------
class EvalServer::Impl : public VqEval::Service {
public:
    Impl(std::uint16_t port, Options opt)
        : opt_{opt}
        , addr_("0.0.0.0:" + std::to_string(port))
    {
        opt_.defaults.validate();

        grpc::ServerBuilder b;
        b.AddListeningPort(addr_, grpc::InsecureServerCredentials(), &port_);
        b.RegisterService(this);
        server_ = b.BuildAndStart();
        if (!server_ || port_ == 0)
            throw std::runtime_error("EvalServer: cannot listen on " + addr_);
        std::cout << "[rpc-server] listening at 0.0.0.0:" << port_ << "\n";

        running_ = true;
        if (opt_.monitorMs > 0) {
            mon_ = std::thread([this]{
                std::unique_lock<std::mutex> lk(monMtx_);
                while (running_) {
                    monCv_.wait_for(lk, std::chrono::milliseconds(opt_.monitorMs));
                    if (!running_) break;
                    if (active_.load() > 0)
                        std::cout << "[rpc-server] active=" << active_.load()
                                  << " served=" << served_.load() << "\n";
                }
            });
        }
    }

    ~Impl() override {
        shutdown();
        if (mon_.joinable()) mon_.join();
    }

    int port() const { return port_; }

    void wait() { server_->Wait(); }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(monMtx_);
            if (!running_) return;
            running_ = false;
        }
        monCv_.notify_all();
        server_->Shutdown();
    }

    ::grpc::Status Evaluate(::grpc::ServerContext* ctx,
                            const EvaluateRequest* req,
                            EvaluateReply* reply) override
    {
        return run(ctx, *req, reply, nullptr);
    }

    // Streams one update per compared pair, then the final reply.
    ::grpc::Status EvaluateStream(::grpc::ServerContext* ctx,
                                  const EvaluateRequest* req,
                                  ::grpc::ServerWriter<EvaluateUpdate>* writer) override
    {
        std::atomic<bool> writeFailed{false};
        SampleObserver onSample = [&](const MetricSample& s) {
            if (writeFailed) return;
            EvaluateUpdate u;
            auto* m = u.mutable_sample();
            m->set_index(s.index);
            m->set_psnr(s.psnr);
            m->set_ssim(s.ssim);
            if (!writer->Write(u)) writeFailed = true;
        };

        EvaluateReply result;
        ::grpc::Status st = run(ctx, *req, &result, onSample, &writeFailed);
        if (!st.ok()) return st;

        EvaluateUpdate last;
        *last.mutable_result() = result;
        if (!writer->Write(last))
            std::cerr << "[rpc-server] client went away before the result was sent\n";
        return ::grpc::Status::OK;
    }

private:
    /* Decrements the active counter when the call ends. */
    struct Slot {
        std::atomic<int>& n;
        ~Slot() { --n; }
    };

    ::grpc::Status run(::grpc::ServerContext* ctx,
                       const EvaluateRequest& req,
                       EvaluateReply* reply,
                       const SampleObserver& onSample,
                       const std::atomic<bool>* stopFlag = nullptr)
    {
        if (++active_ > opt_.maxConcurrent) {
            --active_;
            return ::grpc::Status(::grpc::StatusCode::RESOURCE_EXHAUSTED,
                                  "too many evaluations in progress");
        }
        Slot slot{active_};

        std::cout << "[rpc-server] evaluate ref=" << req.reference_path()
                  << " cand=" << req.candidate_path() << "\n";

        std::atomic<bool> cancel{false};
        const auto t0 = std::chrono::steady_clock::now();
        try {
            EvalConfig cfg = configFrom(req, opt_.defaults, opt_.workerThreads);
            auto backend = makeBackend(cfg.backend);
            Evaluator ev(*backend, cfg);
            ev.setObserver([&](const MetricSample& s) {
                if (onSample) onSample(s);
                if (ctx->IsCancelled() || (stopFlag && stopFlag->load())) cancel = true;
            });

            auto ref  = openSource(req.reference_path());
            auto cand = openSource(req.candidate_path());
            const EvaluationResult res = ev.evaluate(*ref, *cand, &cancel);

            reply->set_ok(true);
            reply->set_error(ErrorKindPB::ERROR_KIND_NONE);
            reply->set_mean_psnr(res.meanPsnr);
            reply->set_mean_ssim(res.meanSsim);
            reply->set_count(res.count);
            reply->set_planned(res.planned);
            reply->set_psnr_label(label(psnrBand(res.meanPsnr)));
            reply->set_ssim_label(label(ssimBand(res.meanSsim)));
        } catch (const EvalError& e) {
            reply->set_ok(false);
            reply->set_error(to_pb(e.kind()));
            reply->set_message(e.what());
            std::cerr << "[rpc-server] " << toString(e.kind()) << ": " << e.what() << "\n";
        } catch (const std::invalid_argument& e) {
            reply->set_ok(false);
            reply->set_error(ErrorKindPB::ERROR_KIND_INVALID_ARGUMENT);
            reply->set_message(e.what());
            std::cerr << "[rpc-server] invalid request: " << e.what() << "\n";
        } catch (const std::exception& e) {
            reply->set_ok(false);
            reply->set_error(ErrorKindPB::ERROR_KIND_INTERNAL);
            reply->set_message(e.what());
            std::cerr << "[rpc-server] error: " << e.what() << "\n";
        }

        ++served_;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0).count();
        std::cout << "[rpc-server] done in " << ms << " ms, ok=" << reply->ok()
                  << " pairs=" << reply->count() << "/" << reply->planned() << "\n";
        return ::grpc::Status::OK;
    }

    Options opt_;
    std::string addr_;
    int port_{0};
    std::unique_ptr<grpc::Server> server_;

    std::atomic<int> active_{0};
    std::atomic<std::uint64_t> served_{0};

    bool running_{false};            // guarded by monMtx_
    std::mutex monMtx_;
    std::condition_variable monCv_;
    std::thread mon_;
};

EvalServer::EvalServer(std::uint16_t port)
    : p_(std::make_unique<Impl>(port, Options{})) {}

EvalServer::EvalServer(std::uint16_t port, Options opt)
    : p_(std::make_unique<Impl>(port, opt)) {}

EvalServer::~EvalServer() = default;

int  EvalServer::port() const { return p_->port(); }
void EvalServer::wait()       { p_->wait(); }
void EvalServer::shutdown()   { p_->shutdown(); }

} // namespace vqeval
