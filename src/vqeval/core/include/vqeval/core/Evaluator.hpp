#pragma once
#include "vqeval/core/Backend.hpp"
#include "vqeval/core/Config.hpp"
#include "vqeval/core/VideoSource.hpp"
#include "vqeval/sample/FrameNormalizer.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace vqeval {

/// One scored reference/candidate pair.
struct MetricSample {
    std::size_t index{0};   // frame index read from both sources
    double      psnr{0.0};  // dB, +inf for identical frames
    double      ssim{0.0};
};

/// Final output of one evaluation.
struct EvaluationResult {
    double      meanPsnr{0.0};
    double      meanSsim{0.0};
    std::size_t count{0};     // pairs actually compared
    std::size_t planned{0};   // length of the sample plan

    /// true when a source ran out of decodable frames before the plan ended
    bool partial() const { return count < planned; }
};

using SampleObserver = std::function<void(const MetricSample&)>;

/// Quality evaluator:
/// - plans evenly spaced frame indices over both sources;
/// - decodes and normalizes each pair on the calling thread;
/// - scores pairs through the metric backend (inline or on workers);
/// - reduces the running sums to mean PSNR / mean SSIM.
///
/// Fatal conditions are thrown as EvalError; a source that stops decoding
/// early only shortens the sample set.
/// One evaluate() at a time per instance.
class Evaluator {
public:
    explicit Evaluator(IMetricBackend& backend);
    Evaluator(IMetricBackend& backend, const EvalConfig& cfg);

    /// Compare `cand` against `ref`. `cancel`, when given, is polled before
    /// every sample; once it reads true the call throws EvalError{Cancelled}.
    EvaluationResult evaluate(IVideoSource& ref,
                              IVideoSource& cand,
                              const std::atomic<bool>* cancel = nullptr);

    /// Called once per scored pair, never concurrently.
    void setObserver(SampleObserver obs) { observer_ = std::move(obs); }

    const EvalConfig& config() const { return cfg_; }

private:
    struct Accumulator {
        double      sumPsnr{0.0};
        double      sumSsim{0.0};
        std::size_t count{0};
    };

    IMetricBackend& backend_;
    EvalConfig      cfg_;
    SampleObserver  observer_;

    std::mutex  accMtx_;   // guards the accumulator while workers run
    Accumulator acc_;
    std::mutex  obsMtx_;   // serializes observer calls

    MetricSample score(const NormalizedPair& p);
    void fold(const MetricSample& s);

    using PairSink = std::function<bool(NormalizedPair&&)>;
    // decode loop shared by both modes; stops at the first failed decode
    void decodeLoop(IVideoSource& ref, IVideoSource& cand,
                    const std::vector<std::size_t>& indices,
                    const std::atomic<bool>* cancel,
                    const PairSink& sink);
    void runParallel(IVideoSource& ref, IVideoSource& cand,
                     const std::vector<std::size_t>& indices,
                     const std::atomic<bool>* cancel);
};

} // namespace vqeval
