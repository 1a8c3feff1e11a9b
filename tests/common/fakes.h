#pragma once

#include <vellum/search/relevance_scorer.h>
#include <vellum/vector/embedding_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vellum::tests {

/**
 * Embedding provider with scripted behaviour. By default every text maps to
 * MockEmbeddingProvider::embedOne(text, dimension).
 *  - queued errors are returned (one per call) before any real answer
 *  - a batch containing a poisoned text fails with InvalidData
 *  - `delay` holds each call open, to observe concurrency
 */
class ScriptedEmbeddingProvider : public vector::IEmbeddingProvider {
public:
    explicit ScriptedEmbeddingProvider(size_t dimension = 16, size_t maxBatch = 8)
        : dimension_(dimension), maxBatch_(maxBatch) {}

    Result<std::vector<Embedding>> embed(std::span<const std::string> texts) override {
        int now = inFlight_.fetch_add(1) + 1;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
        }
        auto result = respond(texts);
        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);
        inFlight_.fetch_sub(1);
        return result;
    }

    size_t maxBatchSize() const override { return maxBatch_; }
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "scripted"; }

    void queueError(ErrorCode code, const std::string& message = "scripted failure") {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(Error{code, message});
    }
    void poison(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        poisoned_.insert(text);
    }
    void setWrongDimension(bool on) { wrongDimension_ = on; }
    void setDelay(std::chrono::milliseconds d) { delay_ = d; }

    std::vector<size_t> batchSizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchSizes_;
    }
    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchSizes_.size();
    }
    int peakConcurrency() const { return peak_.load(); }

private:
    Result<std::vector<Embedding>> respond(std::span<const std::string> texts) {
        std::lock_guard<std::mutex> lock(mutex_);
        batchSizes_.push_back(texts.size());
        if (!errors_.empty()) {
            Error e = errors_.front();
            errors_.pop_front();
            return e;
        }
        for (const auto& t : texts) {
            if (poisoned_.count(t))
                return Error{ErrorCode::InvalidData, "poisoned input"};
        }
        std::vector<Embedding> out;
        for (const auto& t : texts) {
            out.push_back(vector::MockEmbeddingProvider::embedOne(
                t, wrongDimension_ ? dimension_ + 1 : dimension_));
        }
        return out;
    }

    size_t dimension_;
    size_t maxBatch_;
    mutable std::mutex mutex_;
    std::deque<Error> errors_;
    std::set<std::string> poisoned_;
    std::vector<size_t> batchSizes_;
    std::atomic<bool> wrongDimension_{false};
    std::chrono::milliseconds delay_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
};

/**
 * Relevance scorer driven by a score function. Batches listed in `failBatches`
 * (0-based call number) fail with NetworkError; `alwaysFail` fails every call.
 */
class ScriptedScorer : public search::IRelevanceScorer {
public:
    using ScoreFn = std::function<float(const std::string& query, const std::string& doc)>;

    explicit ScriptedScorer(ScoreFn fn, size_t maxBatch = 16)
        : fn_(std::move(fn)), maxBatch_(maxBatch) {}

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t call = calls_++;
        if (alwaysFail_ || failBatches_.count(call))
            return Error{ErrorCode::NetworkError, "scorer unreachable"};
        std::vector<float> scores;
        for (const auto& d : documents)
            scores.push_back(fn_(query, d));
        if (shortResponse_ && !scores.empty())
            scores.pop_back();
        return scores;
    }

    size_t maxBatchSize() const override { return maxBatch_; }
    std::string name() const override { return "scripted"; }

    void failBatch(size_t call) { failBatches_.insert(call); }
    void setAlwaysFail(bool on) { alwaysFail_ = on; }
    void setShortResponse(bool on) { shortResponse_ = on; }
    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    ScoreFn fn_;
    size_t maxBatch_;
    mutable std::mutex mutex_;
    size_t calls_ = 0;
    std::set<size_t> failBatches_;
    bool alwaysFail_ = false;
    bool shortResponse_ = false;
};

} // namespace vellum::tests
