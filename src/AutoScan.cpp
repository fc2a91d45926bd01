#include "AutoScan.h"

#include <algorithm>
#include <cmath>

#include "Vitality.h"

namespace rdscan {

namespace {

AutoScanConfig sanitize(AutoScanConfig c) {
    if (c.batchSize < 1) c.batchSize = 1;
    if (c.maxBatches < 0) c.maxBatches = 0;
    if (c.targetQueueSize < 0) c.targetQueueSize = 0;
    return c;
}

void sortByScore(std::vector<Candidate>& queue) {
    std::stable_sort(queue.begin(), queue.end(), [](const Candidate& a, const Candidate& b) {
        return a.score > b.score;
    });
}

std::string lastChars(const std::string& s, std::size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

} // namespace

bool VisibilityFilter::passes(const Candidate& c) const {
    return !enabled || c.specialLikelihood.value_or(0.0) >= threshold;
}

const char* scanStateName(ScanState s) {
    switch (s) {
        case ScanState::Idle: return "idle";
        case ScanState::Scanning: return "scanning";
    }
    return "unknown";
}

Candidate normalizeCandidate(Candidate c, const SpecialScorer& scorer) {
    if (!c.vitalityScore) {
        c.vitalityScore = classify(c.metrics).score;
    }
    if (!c.specialLikelihood) {
        c.specialLikelihood = scorer.score(c.metrics, c.params);
    }
    c.score = blendedScore(*c.vitalityScore, *c.specialLikelihood);
    return c;
}

std::vector<Candidate> visibleCandidates(const std::vector<Candidate>& queue, const VisibilityFilter& filter) {
    std::vector<Candidate> out;
    for (const auto& c : queue) {
        if (filter.passes(c)) out.push_back(c);
    }
    return out;
}

std::vector<Candidate> undecidedCandidates(const std::vector<Candidate>& queue, const AutoTagPolicy& policy) {
    std::vector<Candidate> out;
    for (const auto& c : queue) {
        const double p = c.specialLikelihood.value_or(0.0);
        if (p > policy.normalThreshold && p < policy.specialThreshold) out.push_back(c);
    }
    return out;
}

AutoScanner::AutoScanner(FeedbackStore& store, SpecialScorer scorer, const AutoScanConfig& config)
    : store_(store),
      scorer_(std::move(scorer)),
      config_(sanitize(config)),
      evaluator_(config_.evaluation),
      rng_(config_.rngSeed),
      clock_([] { return std::chrono::system_clock::now(); }) {}

bool AutoScanner::setConfig(const AutoScanConfig& config) {
    if (scanning()) return false;
    const bool reseed = config.rngSeed != config_.rngSeed;
    config_ = sanitize(config);
    evaluator_.setOptions(config_.evaluation);
    if (reseed) rng_.seed(config_.rngSeed);
    return true;
}

void AutoScanner::setAutoTagPolicy(const AutoTagPolicy& policy) {
    config_.autoTag = policy;
    retagQueue();
}

void AutoScanner::setClock(Clock clock) {
    if (clock) {
        clock_ = std::move(clock);
    } else {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string AutoScanner::now() const {
    return isoTimestamp(clock_());
}

// ------------------------------------------------------------
// Scan state machine
// ------------------------------------------------------------

bool AutoScanner::requestScan() {
    if (scanning()) return false;

    cancelRequested_ = false;
    cancelled_ = false;
    progress_ = 0.0;
    batchIndex_ = 0;
    plannedBatches_ = 0;
    batchParams_.clear();
    batchResults_.clear();
    batchCursor_ = 0;

    normalize();
    const int visible = visibleCount();
    if (visible >= config_.targetQueueSize) {
        progress_ = 1.0;
        return true;
    }

    const int remaining = config_.targetQueueSize - visible;
    const int required = std::max(1, (remaining + config_.batchSize - 1) / config_.batchSize);
    plannedBatches_ = std::min(required, config_.maxBatches);
    if (plannedBatches_ == 0) {
        progress_ = 1.0;
        return true;
    }

    evaluator_.setOptions(config_.evaluation);
    const std::int64_t startMillis = epochMillis(clock_());
    do {
        scanPrefix_ = std::to_string(startMillis) + "-" + std::to_string(scanSeq_++) + "-";
    } while (idPrefixInUse(scanPrefix_));
    state_ = ScanState::Scanning;
    return true;
}

void AutoScanner::startBatch() {
    const std::vector<SimulationParams> specials = store_.specialParams();
    batchParams_.clear();
    batchResults_.clear();
    batchCursor_ = 0;
    batchParams_.reserve(static_cast<std::size_t>(config_.batchSize));
    for (int i = 0; i < config_.batchSize; ++i) {
        batchParams_.push_back(sampleCandidate(rng_, specials, config_.sampling));
    }
}

// Queue entries and stored records (including ones imported from an earlier
// session) must never share an id with a new candidate.
bool AutoScanner::idPrefixInUse(const std::string& prefix) const {
    for (const auto& c : queue_) {
        if (c.id.compare(0, prefix.size(), prefix) == 0) return true;
    }
    for (const auto& r : store_.list()) {
        if (r.id.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

Candidate AutoScanner::scoreResult(const EvaluationResult& result, int slot) const {
    Candidate c;
    c.id = scanPrefix_ + std::to_string(batchIndex_) + "-" + std::to_string(slot);
    c.params = result.params;
    c.metrics = result.average;

    const VitalityAssessment vitality = classify(result.average);
    c.classification = vitality.category;
    c.vitalityScore = vitality.score;
    c.specialLikelihood = scorer_.score(result.average, result.params);
    c.score = blendedScore(vitality.score, *c.specialLikelihood);
    return c;
}

bool AutoScanner::step() {
    if (!scanning()) return false;

    if (cancelRequested_) {
        cancelled_ = true;
        finishBatch();
        finish();
        return false;
    }

    if (batchParams_.empty()) startBatch();

    const int slot = static_cast<int>(batchCursor_);
    const EvaluationResult result = evaluator_.evaluateOne(batchParams_[batchCursor_]);
    ++batchCursor_;
    if (result.valid) {
        batchResults_.push_back(scoreResult(result, slot));
    }

    const double inBatch = static_cast<double>(batchCursor_) / static_cast<double>(batchParams_.size());
    updateProgress((batchIndex_ + inBatch) / plannedBatches_);

    if (batchCursor_ < batchParams_.size()) return true;

    finishBatch();
    if (visibleCount() >= config_.targetQueueSize || batchIndex_ >= plannedBatches_) {
        finish();
        return false;
    }
    return true;
}

void AutoScanner::finishBatch() {
    if (batchParams_.empty()) return;

    for (const auto& c : batchResults_) {
        queue_.push_back(c);
    }
    sortByScore(queue_);

    const std::string notedAt = now();
    for (const auto& c : batchResults_) {
        store_.applyAutoTag(c, config_.autoTag, notedAt);
    }

    ++batchIndex_;
    batchParams_.clear();
    batchResults_.clear();
    batchCursor_ = 0;
}

void AutoScanner::finish() {
    state_ = ScanState::Idle;
    cancelRequested_ = false;
    progress_ = 1.0;
}

void AutoScanner::cancel() {
    if (scanning()) cancelRequested_ = true;
}

void AutoScanner::updateProgress(double fraction) {
    if (!std::isfinite(fraction)) return;
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (fraction > progress_) progress_ = fraction;
}

void AutoScanner::run(const ProgressFn& onProgress, const CancelFn& shouldCancel) {
    if (onProgress) onProgress(progress_);
    while (scanning()) {
        if (shouldCancel && shouldCancel()) cancel();
        step();
        if (onProgress) onProgress(progress_);
    }
}

// ------------------------------------------------------------
// Queue
// ------------------------------------------------------------

void AutoScanner::enqueue(Candidate c) {
    queue_.push_back(normalizeCandidate(std::move(c), scorer_));
    sortByScore(queue_);
}

const Candidate* AutoScanner::findCandidate(const std::string& id) const {
    for (const auto& c : queue_) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

std::size_t AutoScanner::normalize() {
    std::size_t filled = 0;
    for (auto& c : queue_) {
        if (!c.vitalityScore || !c.specialLikelihood) ++filled;
        c = normalizeCandidate(std::move(c), scorer_);
    }
    return filled;
}

std::vector<Candidate> AutoScanner::visibleQueue() const {
    return visibleCandidates(queue_, config_.filter);
}

std::vector<Candidate> AutoScanner::undecidedQueue() const {
    return undecidedCandidates(queue_, config_.autoTag);
}

int AutoScanner::visibleCount() const {
    return static_cast<int>(std::count_if(queue_.begin(), queue_.end(), [this](const Candidate& c) {
        return config_.filter.passes(c);
    }));
}

int AutoScanner::retagQueue() {
    const std::string notedAt = now();
    int changed = 0;
    for (const auto& c : queue_) {
        if (store_.applyAutoTag(c, config_.autoTag, notedAt)) ++changed;
    }
    return changed;
}

// ------------------------------------------------------------
// User actions
// ------------------------------------------------------------

bool AutoScanner::discard(const std::string& id) {
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const Candidate& c) { return c.id == id; });
    if (it == queue_.end()) return false;
    queue_.erase(it);
    return true;
}

std::optional<BookmarkEntry> AutoScanner::adopt(const std::string& id, int resolution) {
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const Candidate& c) { return c.id == id; });
    if (it == queue_.end()) return std::nullopt;

    const auto t = clock_();
    BookmarkEntry entry;
    entry.id = std::to_string(epochMillis(t)) + "-" + it->id;
    entry.name = "Auto Seed " + lastChars(it->id, 4);
    entry.params = it->params;
    entry.resolution = resolution;
    entry.savedAt = isoTimestamp(t);
    entry.metrics = it->metrics;

    queue_.erase(it);
    if (bookmarkSink_) bookmarkSink_(entry);
    return entry;
}

bool AutoScanner::replay(const std::string& id) const {
    const Candidate* c = findCandidate(id);
    if (!c) return false;
    if (replaySink_) replaySink_(c->params);
    return true;
}

bool AutoScanner::label(const std::string& id, FeedbackLabel label) {
    const Candidate* c = findCandidate(id);
    if (!c) return false;
    store_.labelByUser(*c, label, now());
    return true;
}

} // namespace rdscan
