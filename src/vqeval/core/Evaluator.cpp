#include "vqeval/core/Evaluator.hpp"
#include "vqeval/core/Errors.hpp"
#include "vqeval/core/SampleQueue.hpp"
#include "vqeval/sample/FrameSampler.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace vqeval {

Evaluator::Evaluator(IMetricBackend& backend)
    : Evaluator(backend, EvalConfig{}) {}

Evaluator::Evaluator(IMetricBackend& backend, const EvalConfig& cfg)
    : backend_(backend), cfg_(cfg)
{
    cfg_.validate();
}

MetricSample Evaluator::score(const NormalizedPair& p) {
    MetricSample s{};
    s.index = p.index;
    s.psnr  = backend_.psnr(p.reference8u, p.candidate8u);
    s.ssim  = backend_.ssim(p.reference8u, p.candidate8u, cfg_.ssimWindow);
    return s;
}

void Evaluator::fold(const MetricSample& s) {
    {
        std::lock_guard<std::mutex> lk(accMtx_);
        acc_.sumPsnr += s.psnr;
        acc_.sumSsim += s.ssim;
        ++acc_.count;
    }
    // observers may block (network writes); keep other workers folding
    if (observer_) {
        std::lock_guard<std::mutex> lk(obsMtx_);
        observer_(s);
    }
}

void Evaluator::decodeLoop(IVideoSource& ref, IVideoSource& cand,
                           const std::vector<std::size_t>& indices,
                           const std::atomic<bool>* cancel,
                           const PairSink& sink)
{
    const cv::Size target(cfg_.targetWidth, cfg_.targetHeight);
    std::size_t handed = 0;

    for (const std::size_t idx : indices) {
        if (cancel && cancel->load()) {
            throw EvalError(ErrorKind::Cancelled,
                            "evaluation cancelled after " + std::to_string(handed) + " pairs");
        }

        // a view only lives until the next read() on its source, and ref and
        // cand may be the same handle: copy the reference out first
        auto r = ref.read(idx);
        if (!r) {
            std::cerr << "[evaluator] reference: no frame at index " << idx
                      << ", stopping after " << handed << "/" << indices.size() << " pairs\n";
            break;
        }
        const cv::Mat refBgr = frameToBgr8(*r);

        auto c = cand.read(idx);
        if (!c) {
            std::cerr << "[evaluator] candidate: no frame at index " << idx
                      << ", stopping after " << handed << "/" << indices.size() << " pairs\n";
            break;
        }

        NormalizedPair pair = normalizePair(refBgr, frameToBgr8(*c),
                                            cfg_.keepNativeSize() ? cv::Size() : target);
        pair.index = idx;
        if (!sink(std::move(pair))) break;
        ++handed;
    }
}

void Evaluator::runParallel(IVideoSource& ref, IVideoSource& cand,
                            const std::vector<std::size_t>& indices,
                            const std::atomic<bool>* cancel)
{
    SampleQueue queue(cfg_.queueDepth);

    std::mutex errMtx;
    std::exception_ptr workerError;

    std::vector<std::thread> workers;
    workers.reserve(cfg_.workerThreads);
    try {
        for (std::size_t t = 0; t < cfg_.workerThreads; ++t) {
            workers.emplace_back([&]{
                NormalizedPair p;
                while (queue.pop(p)) {
                    try {
                        fold(score(p));
                    } catch (...) {
                        {
                            std::lock_guard<std::mutex> lk(errMtx);
                            if (!workerError) workerError = std::current_exception();
                        }
                        queue.abort();
                        return;
                    }
                }
            });
        }
    } catch (const std::system_error& e) {
        // thread creation failed: release the ones already running
        std::cerr << "[evaluator] cannot start metric workers: " << e.what() << "\n";
        queue.abort();
        for (auto& w : workers) w.join();
        throw;
    }

    // this thread is the only one touching the sources
    std::exception_ptr producerError;
    try {
        decodeLoop(ref, cand, indices, cancel,
                   [&queue](NormalizedPair&& p) { return queue.push(std::move(p)); });
    } catch (...) {
        producerError = std::current_exception();
        queue.abort();
    }

    queue.close();
    for (auto& w : workers) w.join();

    if (producerError) std::rethrow_exception(producerError);
    if (workerError)   std::rethrow_exception(workerError);
}

EvaluationResult Evaluator::evaluate(IVideoSource& ref,
                                     IVideoSource& cand,
                                     const std::atomic<bool>* cancel)
{
    if (!ref.isOpen())
        throw EvalError(ErrorKind::SourceUnavailable, "reference source is not open");
    if (!cand.isOpen())
        throw EvalError(ErrorKind::SourceUnavailable, "candidate source is not open");

    const std::size_t refCount  = ref.frameCount();
    const std::size_t candCount = cand.frameCount();
    const SamplePlan plan = planSamples(refCount, candCount, cfg_.maxSamples);
    if (plan.empty()) {
        throw EvalError(ErrorKind::EmptySource,
                        "no frames to compare (reference=" + std::to_string(refCount) +
                        ", candidate=" + std::to_string(candCount) + ")");
    }

    {
        std::lock_guard<std::mutex> lk(accMtx_);
        acc_ = Accumulator{};
    }

    if (cfg_.workerThreads == 0) {
        decodeLoop(ref, cand, plan.indices, cancel,
                   [this](NormalizedPair&& p) { fold(score(p)); return true; });
    } else {
        runParallel(ref, cand, plan.indices, cancel);
    }

    EvaluationResult res{};
    res.planned = plan.size();
    {
        std::lock_guard<std::mutex> lk(accMtx_);
        res.count = acc_.count;
        if (acc_.count > 0) {
            res.meanPsnr = acc_.sumPsnr / static_cast<double>(acc_.count);
            res.meanSsim = acc_.sumSsim / static_cast<double>(acc_.count);
        }
    }

    if (res.count == 0) {
        throw EvalError(ErrorKind::NoComparablePairs,
                        "none of the " + std::to_string(plan.size()) +
                        " planned pairs could be decoded from both sources");
    }
    if (res.partial()) {
        std::cerr << "[evaluator] partial result: " << res.count << " of "
                  << res.planned << " planned pairs compared\n";
    }
    return res;
}

} // namespace vqeval
