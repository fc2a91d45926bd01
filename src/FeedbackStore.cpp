#include "FeedbackStore.h"

#include <json/json.h>

#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace rdscan {

namespace {

// Curated seeds that must always read as "normal", whatever an import says.
const std::set<std::string>& normalizedManualNormals() {
    static const std::set<std::string> ids{"manual-2", "manual-4", "manual-5"};
    return ids;
}

FeedbackRecord curated(const char* id, FeedbackLabel label, const char* notedAt,
                       SimulationParams p, double stdU, double stdV, double entropy,
                       double score) {
    FeedbackRecord r;
    r.id = id;
    r.label = label;
    r.notedAt = notedAt;
    r.params = p;
    r.metrics.stdU = stdU;
    r.metrics.stdV = stdV;
    r.metrics.entropy = entropy;
    r.classification = VitalityCategory::Structured;
    r.score = score;
    r.source = FeedbackSource::Manual;
    return r;
}

SimulationParams P(double du, double dv, double feed, double kill, double dt,
                   double threshold, double contrast, double gamma, bool invert) {
    SimulationParams p;
    p.du = du;
    p.dv = dv;
    p.feed = feed;
    p.kill = kill;
    p.dt = dt;
    p.threshold = threshold;
    p.contrast = contrast;
    p.gamma = gamma;
    p.invert = invert;
    return p;
}

std::vector<FeedbackRecord> buildCuratedSeeds() {
    const FeedbackLabel S = FeedbackLabel::Special;
    const FeedbackLabel N = FeedbackLabel::Normal;
    return {
        curated("manual-1", S, "2025-09-27T23:28:41.000Z", P(0.043, 0.009, 0.001, 0.026, 2.0, 0.2, 5.0, 0.2, false), 0.272, 0.044, 0.21, 0.65),
        curated("manual-2", N, "2025-09-27T23:27:48.000Z", P(0.043, 0.009, 0.002, 0.021, 1.5, 0.2, 5.0, 0.2, false), 0.339, 0.074, 0.73, 0.72),
        curated("manual-3", S, "2025-09-27T23:25:55.000Z", P(0.621, 0.07, 0.003, 0.021, 1.5, 0.2, 5.0, 0.2, false), 0.0, 0.0, 0.0, 0.55),
        curated("manual-4", N, "2025-09-27T23:22:05.000Z", P(0.722, 0.08, 0.02, 0.056, 1.5, 0.16, 5.0, 0.2, true), 0.116, 0.329, 2.61, 0.88),
        curated("manual-5", N, "2025-09-27T23:19:10.000Z", P(0.621, 0.07, 0.1, 0.07, 1.5, 0.2, 5.0, 0.2, false), 0.264, 0.25, 1.24, 0.81),
        curated("manual-6", S, "2025-09-27T23:16:49.000Z", P(0.547, 0.089, 0.084, 0.077, 1.5, 0.2, 5.0, 0.2, false), 0.201, 0.169, 0.6, 0.7),
        curated("manual-7", S, "2025-09-27T23:13:46.000Z", P(1.0, 0.306, 0.023, 0.06, 1.0, 0.2, 1.5, 1.1, false), 0.123, 0.125, 1.35, 0.78),
        curated("manual-8", S, "2025-09-27T23:06:48.000Z", P(1.0, 0.266, 0.1, 0.054, 1.0, 0.2, 1.5, 1.1, false), 0.208, 0.14, 0.84, 0.69),
        curated("manual-9", S, "2025-09-27T23:19:56.000Z", P(0.041, 0.028, 0.015, 0.044, 2.0, 0.21, 2.45, 0.4, false), 0.262, 0.074, 0.34, 0.67),
    };
}

double readNumber(const Json::Value& v, const char* key, double fallback) {
    if (!v.isObject()) return fallback;
    const Json::Value& x = v[key];
    if (!x.isNumeric()) return fallback;
    const double d = x.asDouble();
    return std::isfinite(d) ? d : fallback;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

// --------------------
// Names
// --------------------

const char* feedbackLabelName(FeedbackLabel l) {
    return l == FeedbackLabel::Special ? "special" : "normal";
}

bool parseFeedbackLabel(const std::string& s, FeedbackLabel& out) {
    if (s == "special") { out = FeedbackLabel::Special; return true; }
    if (s == "normal")  { out = FeedbackLabel::Normal;  return true; }
    return false;
}

const char* feedbackSourceName(FeedbackSource s) {
    switch (s) {
        case FeedbackSource::User:    return "user";
        case FeedbackSource::AutoTag: return "auto-tag";
        case FeedbackSource::Manual:  return "manual";
        default:                      return "user";
    }
}

bool parseFeedbackSource(const std::string& s, FeedbackSource& out) {
    // "auto-scan" is what older exports call a user label.
    if (s == "user" || s == "auto-scan") { out = FeedbackSource::User;    return true; }
    if (s == "auto-tag")                 { out = FeedbackSource::AutoTag; return true; }
    if (s == "manual")                   { out = FeedbackSource::Manual;  return true; }
    return false;
}

std::optional<FeedbackLabel> autoTagLabel(double likelihood, const AutoTagPolicy& policy) {
    if (!std::isfinite(likelihood)) return std::nullopt;
    if (likelihood >= policy.specialThreshold) return FeedbackLabel::Special;
    if (likelihood <= policy.normalThreshold) return FeedbackLabel::Normal;
    return std::nullopt;
}

// --------------------
// Time
// --------------------

std::int64_t epochMillis(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::string isoTimestamp(std::chrono::system_clock::time_point t) {
    const std::int64_t ms = epochMillis(t);
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    const int millis = static_cast<int>(ms % 1000);

    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(n), buf, millis < 0 ? 0 : millis);
    return out;
}

std::string isoTimestampNow() {
    return isoTimestamp(std::chrono::system_clock::now());
}

// --------------------
// JSON helpers
// --------------------

Json::Value paramsToJson(const SimulationParams& p) {
    Json::Value v(Json::objectValue);
    v["du"] = p.du;
    v["dv"] = p.dv;
    v["feed"] = p.feed;
    v["kill"] = p.kill;
    v["dt"] = p.dt;
    v["threshold"] = p.threshold;
    v["contrast"] = p.contrast;
    v["gamma"] = p.gamma;
    v["invert"] = p.invert;
    return v;
}

SimulationParams paramsFromJson(const Json::Value& v) {
    SimulationParams p;
    p.du = readNumber(v, "du", 0.0);
    p.dv = readNumber(v, "dv", 0.0);
    p.feed = readNumber(v, "feed", 0.0);
    p.kill = readNumber(v, "kill", 0.0);
    p.dt = readNumber(v, "dt", 1.0);
    p.threshold = readNumber(v, "threshold", 0.0);
    p.contrast = readNumber(v, "contrast", 1.0);
    p.gamma = readNumber(v, "gamma", 1.0);
    p.invert = v.isObject() && v["invert"].isBool() && v["invert"].asBool();
    return p;
}

Json::Value metricsToJson(const MetricsVector& m) {
    Json::Value v(Json::objectValue);
    v["meanU"] = m.meanU;
    v["meanV"] = m.meanV;
    v["stdU"] = m.stdU;
    v["stdV"] = m.stdV;
    v["activity"] = m.activity;
    v["entropy"] = m.entropy;
    return v;
}

MetricsVector metricsFromJson(const Json::Value& v) {
    MetricsVector m;
    m.meanU = readNumber(v, "meanU", 0.0);
    m.meanV = readNumber(v, "meanV", 0.0);
    m.stdU = readNumber(v, "stdU", 0.0);
    m.stdV = readNumber(v, "stdV", 0.0);
    m.activity = readNumber(v, "activity", 0.0);
    m.entropy = readNumber(v, "entropy", 0.0);
    return m;
}

Json::Value feedbackRecordToJson(const FeedbackRecord& r) {
    Json::Value v(Json::objectValue);
    v["id"] = r.id;
    v["label"] = feedbackLabelName(r.label);
    v["notedAt"] = r.notedAt;
    v["params"] = paramsToJson(r.params);
    v["metrics"] = metricsToJson(r.metrics);
    v["classification"] = vitalityName(r.classification);
    v["score"] = r.score;
    v["source"] = feedbackSourceName(r.source);
    if (r.note) {
        v["note"] = *r.note;
    }
    return v;
}

bool feedbackRecordFromJson(const Json::Value& v, FeedbackRecord& out, std::string* why) {
    if (!v.isObject()) {
        if (why) *why = "record is not an object";
        return false;
    }
    if (!v["id"].isString() || v["id"].asString().empty()) {
        if (why) *why = "record has no id";
        return false;
    }

    FeedbackRecord r;
    r.id = v["id"].asString();
    if (!v["label"].isString() || !parseFeedbackLabel(v["label"].asString(), r.label)) {
        if (why) *why = "record '" + r.id + "' has an unknown label";
        return false;
    }
    r.notedAt = v["notedAt"].isString() ? v["notedAt"].asString() : std::string();
    r.params = paramsFromJson(v["params"]);
    r.metrics = metricsFromJson(v["metrics"]);

    // Classification is derived data; recompute when absent or unknown.
    if (!v["classification"].isString() || !parseVitality(v["classification"].asString(), r.classification)) {
        r.classification = classify(r.metrics).category;
    }
    r.score = readNumber(v, "score", 0.0);
    if (!v["source"].isString() || !parseFeedbackSource(v["source"].asString(), r.source)) {
        r.source = FeedbackSource::User;
    }
    if (v["note"].isString()) {
        r.note = v["note"].asString();
    }
    out = std::move(r);
    return true;
}

// --------------------
// FeedbackStore
// --------------------

const std::vector<FeedbackRecord>& FeedbackStore::curatedSeeds() {
    static const std::vector<FeedbackRecord> seeds = buildCuratedSeeds();
    return seeds;
}

FeedbackStore FeedbackStore::withCuratedSeeds() {
    FeedbackStore store;
    for (const auto& r : curatedSeeds()) {
        store.put(r);
    }
    return store;
}

const FeedbackRecord* FeedbackStore::find(const std::string& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

void FeedbackStore::put(const FeedbackRecord& r) {
    FeedbackRecord copy = r;
    if (normalizedManualNormals().count(copy.id) != 0) {
        copy.label = FeedbackLabel::Normal;
    }
    records_[copy.id] = std::move(copy);
}

bool FeedbackStore::applyAutoTag(const Candidate& c, const AutoTagPolicy& policy, const std::string& notedAt) {
    if (!policy.enabled || !c.specialLikelihood) return false;

    const std::optional<FeedbackLabel> label = autoTagLabel(*c.specialLikelihood, policy);
    if (!label) return false;

    auto it = records_.find(c.id);
    if (it != records_.end()) {
        const FeedbackRecord& existing = it->second;
        if (existing.source != FeedbackSource::AutoTag) return false;
        if (existing.label == *label) return false;
    }

    FeedbackRecord r;
    r.id = c.id;
    r.label = *label;
    r.notedAt = notedAt;
    r.params = c.params;
    r.metrics = c.metrics;
    r.classification = c.classification;
    r.score = c.score;
    r.source = FeedbackSource::AutoTag;
    if (it != records_.end()) {
        r.note = it->second.note;
    }
    records_[c.id] = std::move(r);
    return true;
}

void FeedbackStore::labelByUser(const Candidate& c, FeedbackLabel label, const std::string& notedAt) {
    FeedbackRecord r;
    r.id = c.id;
    r.label = label;
    r.notedAt = notedAt;
    r.params = c.params;
    r.metrics = c.metrics;
    r.classification = c.classification;
    r.score = c.score;
    r.source = FeedbackSource::User;

    auto it = records_.find(c.id);
    if (it != records_.end()) {
        r.note = it->second.note;
    }
    records_[c.id] = std::move(r);
}

bool FeedbackStore::setNote(const std::string& id, const std::string& note) {
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    if (note.empty()) {
        it->second.note.reset();
    } else {
        it->second.note = note;
    }
    return true;
}

void FeedbackStore::syncBookmarks(const std::vector<BookmarkEntry>& entries) {
    std::set<std::string> live;
    for (const auto& e : entries) {
        live.insert(kBookmarkPrefix + e.id);
    }

    for (auto it = records_.begin(); it != records_.end();) {
        if (startsWith(it->first, kBookmarkPrefix) && live.count(it->first) == 0) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& e : entries) {
        FeedbackRecord r;
        r.id = kBookmarkPrefix + e.id;
        r.label = FeedbackLabel::Special;
        r.notedAt = e.savedAt;
        r.params = e.params;
        r.metrics = e.metrics ? *e.metrics : MetricsVector{};
        const VitalityAssessment a = classify(r.metrics);
        r.classification = a.category;
        r.score = a.score;
        r.source = FeedbackSource::Manual;
        r.note = e.note;
        records_[r.id] = std::move(r);
    }
}

std::vector<FeedbackRecord> FeedbackStore::list() const {
    std::vector<FeedbackRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second);
    }
    return out;
}

std::vector<FeedbackRecord> FeedbackStore::specialRecords() const {
    std::vector<FeedbackRecord> out;
    for (const auto& kv : records_) {
        if (kv.second.label == FeedbackLabel::Special) out.push_back(kv.second);
    }
    return out;
}

std::vector<FeedbackRecord> FeedbackStore::manualSpecialRecords() const {
    std::vector<FeedbackRecord> out;
    for (const auto& kv : records_) {
        if (kv.second.label == FeedbackLabel::Special && kv.second.source == FeedbackSource::Manual) {
            out.push_back(kv.second);
        }
    }
    return out;
}

std::vector<SimulationParams> FeedbackStore::specialParams() const {
    std::vector<SimulationParams> out;
    for (const auto& kv : records_) {
        if (kv.second.label == FeedbackLabel::Special) out.push_back(kv.second.params);
    }
    return out;
}

Json::Value FeedbackStore::toJson() const {
    Json::Value arr(Json::arrayValue);
    for (const auto& kv : records_) {
        arr.append(feedbackRecordToJson(kv.second));
    }
    return arr;
}

bool FeedbackStore::mergeJson(const Json::Value& root, std::string* why, int* skipped) {
    if (!root.isArray()) {
        if (why) *why = "feedback JSON root is not an array";
        return false;
    }
    int bad = 0;
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        FeedbackRecord r;
        if (!feedbackRecordFromJson(root[i], r)) {
            ++bad;
            continue;
        }
        put(r);
    }
    if (skipped) *skipped = bad;
    return true;
}

bool FeedbackStore::saveJson(const std::string& path, std::string* why) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        if (why) *why = "cannot open for writing: " + path;
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, toJson()) << '\n';
    if (!out) {
        if (why) *why = "write failed: " + path;
        return false;
    }
    return true;
}

bool FeedbackStore::loadJson(const std::string& path, std::string* why, int* skipped) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (why) *why = "cannot open feedback file: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        if (why) *why = "feedback JSON parse error: " + errs;
        return false;
    }
    return mergeJson(root, why, skipped);
}

} // namespace rdscan
