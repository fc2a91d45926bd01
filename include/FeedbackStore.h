#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <json/forwards.h>

#include "Candidate.h"
#include "Metrics.h"
#include "Params.h"
#include "Vitality.h"

namespace rdscan {

enum class FeedbackLabel : int {
    Special = 0,
    Normal = 1,
};

enum class FeedbackSource : int {
    User = 0,    // confirmed by the user
    AutoTag = 1, // written by the auto-tag policy
    Manual = 2,  // curated seed or bookmark
};

const char* feedbackLabelName(FeedbackLabel l);
bool parseFeedbackLabel(const std::string& s, FeedbackLabel& out);
const char* feedbackSourceName(FeedbackSource s);
bool parseFeedbackSource(const std::string& s, FeedbackSource& out);

struct FeedbackRecord {
    std::string id;
    FeedbackLabel label = FeedbackLabel::Normal;
    std::string notedAt; // ISO-8601 UTC
    SimulationParams params{};
    MetricsVector metrics{};
    VitalityCategory classification = VitalityCategory::Dormant;
    double score = 0.0;
    FeedbackSource source = FeedbackSource::User;
    std::optional<std::string> note;
};

struct AutoTagPolicy {
    bool enabled = true;
    double specialThreshold = 0.22;
    double normalThreshold = 0.05;
};

// Label the policy assigns to a likelihood, if any.
std::optional<FeedbackLabel> autoTagLabel(double likelihood, const AutoTagPolicy& policy);

// Bookmark (codex) entry as handed over by the bookmark collaborator.
struct BookmarkEntry {
    std::string id;
    std::string name;
    SimulationParams params{};
    int resolution = 512;
    std::string savedAt;
    std::optional<MetricsVector> metrics;
    std::optional<std::string> note;
};

std::string isoTimestamp(std::chrono::system_clock::time_point t);
std::string isoTimestampNow();
std::int64_t epochMillis(std::chrono::system_clock::time_point t);

// In-memory label map keyed by candidate id. Single writer context.
class FeedbackStore {
public:
    static constexpr const char* kBookmarkPrefix = "codex-";

    FeedbackStore() = default;

    // Store pre-filled with the curated seed records.
    static FeedbackStore withCuratedSeeds();
    static const std::vector<FeedbackRecord>& curatedSeeds();

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const FeedbackRecord* find(const std::string& id) const;
    const std::map<std::string, FeedbackRecord>& records() const { return records_; }

    // Auto-tag write. Returns true when the record was created or changed.
    // Never touches user/manual records; same-label auto records stay as is.
    bool applyAutoTag(const Candidate& c, const AutoTagPolicy& policy, const std::string& notedAt);

    // User label; supersedes any existing record, keeping its note.
    void labelByUser(const Candidate& c, FeedbackLabel label, const std::string& notedAt);

    // Inserts or replaces a record as-is (curated seeds, imports).
    void put(const FeedbackRecord& r);

    bool setNote(const std::string& id, const std::string& note);

    // Re-derives the codex-* records from the current bookmark list.
    void syncBookmarks(const std::vector<BookmarkEntry>& entries);

    std::vector<FeedbackRecord> list() const;
    std::vector<FeedbackRecord> specialRecords() const;
    std::vector<FeedbackRecord> manualSpecialRecords() const;
    std::vector<SimulationParams> specialParams() const;

    Json::Value toJson() const;
    // Merges records over the current contents. Bad entries are skipped and
    // counted in `skipped`; a non-array root fails.
    bool mergeJson(const Json::Value& root, std::string* why = nullptr, int* skipped = nullptr);

    bool saveJson(const std::string& path, std::string* why = nullptr) const;
    bool loadJson(const std::string& path, std::string* why = nullptr, int* skipped = nullptr);

private:
    std::map<std::string, FeedbackRecord> records_;
};

Json::Value paramsToJson(const SimulationParams& p);
SimulationParams paramsFromJson(const Json::Value& v);
Json::Value metricsToJson(const MetricsVector& m);
MetricsVector metricsFromJson(const Json::Value& v);
Json::Value feedbackRecordToJson(const FeedbackRecord& r);
bool feedbackRecordFromJson(const Json::Value& v, FeedbackRecord& out, std::string* why = nullptr);

} // namespace rdscan
