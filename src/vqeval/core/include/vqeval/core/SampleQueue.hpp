#pragma once
#include "vqeval/sample/FrameNormalizer.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace vqeval {

/*
  Bounded, thread-safe hand-off between the decoding thread and the
  metric workers.

  - push() blocks while the queue is full; nothing is ever dropped,
    every decoded pair has to be scored exactly once.
  - close(): no more pushes; pop() drains what is left, then returns false.
  - abort(): stop both sides now (a worker failed); queued pairs are discarded.
*/
class SampleQueue {
public:
    explicit SampleQueue(std::size_t capacity) : cap_(capacity == 0 ? 1 : capacity) {}

    // Returns false if the queue was aborted and the pair was not queued.
    bool push(NormalizedPair&& p) {
        std::unique_lock<std::mutex> lk(m_);
        notFull_.wait(lk, [this]{ return aborted_ || q_.size() < cap_; });
        if (aborted_) return false;
        q_.push_back(std::move(p));
        notEmpty_.notify_one();
        return true;
    }

    // Blocks until a pair is available. Returns false once closed and drained,
    // or right away after abort().
    bool pop(NormalizedPair& out) {
        std::unique_lock<std::mutex> lk(m_);
        notEmpty_.wait(lk, [this]{ return aborted_ || closed_ || !q_.empty(); });
        if (aborted_ || q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
        notEmpty_.notify_all();
    }

    void abort() {
        std::lock_guard<std::mutex> lk(m_);
        aborted_ = true;
        q_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lk(m_);
        return aborted_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

private:
    std::size_t cap_;                    // maximum number of queued pairs
    bool closed_{false};
    bool aborted_{false};
    mutable std::mutex m_;               // protects everything above
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<NormalizedPair> q_;
};

} // namespace vqeval
