#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "Candidate.h"
#include "Evaluator.h"
#include "FeedbackStore.h"
#include "Sampling.h"
#include "SpecialModel.h"

namespace rdscan {

// Threshold filter over special likelihood; disabled means "show all".
struct VisibilityFilter {
    bool enabled = false;
    double threshold = 0.2;

    bool passes(const Candidate& c) const;
};

struct AutoScanConfig {
    int targetQueueSize = 50;
    int batchSize = 6;
    int maxBatches = 12;

    EvaluationOptions evaluation{128, 240, 40, 1337u};
    VisibilityFilter filter{};
    AutoTagPolicy autoTag{};
    SamplingPolicy sampling{};

    // Seeds the parameter sampler (not the grids).
    std::uint32_t rngSeed = 20240229u;
};

enum class ScanState : int {
    Idle = 0,
    Scanning = 1,
};

const char* scanStateName(ScanState s);

// Fills missing vitality/likelihood fields and recomputes the blended score.
Candidate normalizeCandidate(Candidate c, const SpecialScorer& scorer);

// Pure projections over a ranked queue.
std::vector<Candidate> visibleCandidates(const std::vector<Candidate>& queue, const VisibilityFilter& filter);
std::vector<Candidate> undecidedCandidates(const std::vector<Candidate>& queue, const AutoTagPolicy& policy);

// Cooperative candidate search. One step() evaluates one candidate, so the
// host can interleave progress reporting, cancellation and rendering.
class AutoScanner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using ProgressFn = std::function<void(double fraction)>;
    using CancelFn = std::function<bool()>;
    using BookmarkSink = std::function<void(const BookmarkEntry&)>;
    using ReplaySink = std::function<void(const SimulationParams&)>;

    explicit AutoScanner(FeedbackStore& store,
                         SpecialScorer scorer = SpecialScorer(),
                         const AutoScanConfig& config = AutoScanConfig());

    const AutoScanConfig& config() const { return config_; }
    // Applies to the next scan; ignored while scanning.
    bool setConfig(const AutoScanConfig& config);
    void setFilter(const VisibilityFilter& filter) { config_.filter = filter; }
    // Changing thresholds re-tags the current queue.
    void setAutoTagPolicy(const AutoTagPolicy& policy);

    void setClock(Clock clock);
    void setBookmarkSink(BookmarkSink sink) { bookmarkSink_ = std::move(sink); }
    void setReplaySink(ReplaySink sink) { replaySink_ = std::move(sink); }
    void setSnapshotReader(Evaluator::SnapshotReader reader) { evaluator_.setSnapshotReader(std::move(reader)); }

    ScanState state() const { return state_; }
    bool scanning() const { return state_ == ScanState::Scanning; }
    double progress() const { return progress_; }
    int batchesRun() const { return batchIndex_; }
    int plannedBatches() const { return plannedBatches_; }
    bool cancelled() const { return cancelled_; }

    // Idle -> Scanning. A request while scanning is a silent no-op (false).
    // Finishes on the spot when the visible queue already meets the target.
    bool requestScan();

    // Evaluates one candidate. Returns true while more work remains.
    bool step();

    // Observed before the next candidate; completed work is kept.
    void cancel();

    // Drives step() until the scan ends. `shouldCancel` is polled before
    // every candidate.
    void run(const ProgressFn& onProgress = ProgressFn(), const CancelFn& shouldCancel = CancelFn());

    const std::vector<Candidate>& queue() const { return queue_; }
    void enqueue(Candidate c);
    void clearQueue() { queue_.clear(); }
    const Candidate* findCandidate(const std::string& id) const;

    std::size_t normalize();
    std::vector<Candidate> visibleQueue() const;
    std::vector<Candidate> undecidedQueue() const;
    int visibleCount() const;

    // Re-applies the auto-tag policy to every queued candidate.
    int retagQueue();

    // User actions.
    bool discard(const std::string& id);
    std::optional<BookmarkEntry> adopt(const std::string& id, int resolution);
    bool replay(const std::string& id) const;
    bool label(const std::string& id, FeedbackLabel label);

private:
    void startBatch();
    void finishBatch();
    void finish();
    void updateProgress(double fraction);
    Candidate scoreResult(const EvaluationResult& result, int slot) const;
    bool idPrefixInUse(const std::string& prefix) const;
    std::string now() const;

    FeedbackStore& store_;
    SpecialScorer scorer_;
    AutoScanConfig config_;
    Evaluator evaluator_;
    std::mt19937 rng_;
    Clock clock_;
    BookmarkSink bookmarkSink_;
    ReplaySink replaySink_;

    ScanState state_ = ScanState::Idle;
    std::vector<Candidate> queue_;

    // In-flight scan.
    // "<scanStartMillis>-<scanSeq>-"; scanSeq_ only grows.
    std::string scanPrefix_;
    std::uint64_t scanSeq_ = 0;
    int plannedBatches_ = 0;
    int batchIndex_ = 0;
    std::vector<SimulationParams> batchParams_;
    std::vector<Candidate> batchResults_;
    std::size_t batchCursor_ = 0;
    bool cancelRequested_ = false;
    bool cancelled_ = false;
    double progress_ = 0.0;
};

} // namespace rdscan
