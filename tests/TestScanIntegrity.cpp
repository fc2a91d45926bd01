#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include <algorithm>
#include <chrono>
#include <random>
#include <set>

#include <json/json.h>

#include "AutoScan.h"
#include "Evaluator.h"
#include "FeedbackStore.h"
#include "GridSimulator.h"
#include "Heatmap.h"
#include "Metrics.h"
#include "Params.h"
#include "Sampling.h"
#include "SimulationSession.h"
#include "SpecialModel.h"
#include "Vitality.h"

#ifndef RDSCAN_DATA_DIR
#define RDSCAN_DATA_DIR "data"
#endif

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline bool inUnit(double x) { return x >= 0.0 && x <= 1.0; }

static void requireMetricsEqual(const rdscan::MetricsVector& a, const rdscan::MetricsVector& b, const char* ctx) {
    REQUIRE(a.meanU == b.meanU, ctx << ": meanU differs");
    REQUIRE(a.meanV == b.meanV, ctx << ": meanV differs");
    REQUIRE(a.stdU == b.stdU, ctx << ": stdU differs");
    REQUIRE(a.stdV == b.stdV, ctx << ": stdV differs");
    REQUIRE(a.activity == b.activity, ctx << ": activity differs");
    REQUIRE(a.entropy == b.entropy, ctx << ": entropy differs");
}

static void requireWithinValidRanges(const rdscan::SimulationParams& p, const char* ctx) {
    for (int i = 0; i < rdscan::kNumParamKeys; ++i) {
        const rdscan::ParamKey key = static_cast<rdscan::ParamKey>(i);
        if (key == rdscan::ParamKey::Invert) continue;
        const rdscan::ParamRange r = rdscan::validRange(key);
        const double v = rdscan::paramValue(p, key);
        REQUIRE_FINITE(v, rdscan::paramKeyName(key));
        REQUIRE(v >= r.min && v <= r.max, ctx << ": " << rdscan::paramKeyName(key) << "=" << v << " outside range");
    }
}

static rdscan::MetricsVector metrics(double activity, double entropy, double stdU, double stdV) {
    rdscan::MetricsVector m;
    m.activity = activity;
    m.entropy = entropy;
    m.stdU = stdU;
    m.stdV = stdV;
    return m;
}

static rdscan::Candidate candidateWithLikelihood(const std::string& id, double likelihood) {
    rdscan::Candidate c;
    c.id = id;
    c.metrics = metrics(0.02, 2.0, 0.1, 0.1);
    const rdscan::VitalityAssessment a = rdscan::classify(c.metrics);
    c.classification = a.category;
    c.vitalityScore = a.score;
    c.specialLikelihood = likelihood;
    c.score = rdscan::blendedScore(a.score, likelihood);
    return c;
}

static std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
}

// Tiny scans so the whole suite stays fast.
static rdscan::AutoScanConfig smallScanConfig() {
    rdscan::AutoScanConfig c;
    c.targetQueueSize = 3;
    c.batchSize = 2;
    c.maxBatches = 4;
    c.evaluation.resolution = 16;
    c.evaluation.totalIterations = 8;
    c.evaluation.sampleInterval = 4;
    c.rngSeed = 7u;
    return c;
}

} // namespace

// =======================
// Parameters
// =======================

static void runParamValidation_1A() {
    rdscan::SimulationParams p = rdscan::defaultParams();
    REQUIRE(rdscan::validateParams(p), "default params must validate");

    std::string why;
    p.du = -0.1;
    REQUIRE(!rdscan::validateParams(p, &why), "negative du must be rejected");
    REQUIRE(why.find("du") != std::string::npos, "reason must name the field, got: " << why);

    p = rdscan::defaultParams();
    p.feed = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(!rdscan::validateParams(p), "NaN feed must be rejected");

    p = rdscan::defaultParams();
    p.gamma = std::numeric_limits<double>::infinity();
    REQUIRE(!rdscan::validateParams(p), "infinite gamma must be rejected");

    rdscan::ParamKey key;
    REQUIRE(rdscan::parseParamKey("kill", key) && key == rdscan::ParamKey::Kill, "parse 'kill'");
    REQUIRE(!rdscan::parseParamKey("velocity", key), "unknown key must not parse");

    p = rdscan::defaultParams();
    rdscan::setParamValue(p, rdscan::ParamKey::Invert, 1.0);
    REQUIRE(p.invert, "invert set from 1.0");
    REQUIRE(rdscan::paramValue(p, rdscan::ParamKey::Invert) == 1.0, "invert reads as 1");

    std::cout << "[PASS] 1A parameter validation + key addressing\n";
}

// =======================
// Grid simulator
// =======================

static void runZeroReactionStepIsNoOp_1B() {
    rdscan::GridState grid(12);
    std::mt19937 rng(3u);
    rdscan::GridSimulator::seed(grid, 12, rng);
    // V = 0 everywhere removes the reaction term.
    for (int y = 0; y < grid.size(); ++y) {
        for (int x = 0; x < grid.size(); ++x) {
            grid.set(x, y, grid.u(x, y), 0.0f);
        }
    }
    const rdscan::Snapshot before = grid.snapshot();

    rdscan::SimulationParams p = rdscan::defaultParams();
    p.du = 0.0;
    p.dv = 0.0;
    p.feed = 0.0;
    p.kill = 0.0;
    REQUIRE(rdscan::GridSimulator::step(grid, p, 5), "step must accept zero-rate params");

    const rdscan::Snapshot after = grid.snapshot();
    REQUIRE(before.u == after.u, "U changed under zero reaction");
    REQUIRE(before.v == after.v, "V changed under zero reaction");
    std::cout << "[PASS] 1B zero-reaction step is a no-op\n";
}

static void runStepRejectsBadInput_1B() {
    rdscan::GridState grid(8);
    std::mt19937 rng(1u);
    rdscan::GridSimulator::seed(grid, 8, rng);
    const rdscan::Snapshot before = grid.snapshot();

    rdscan::SimulationParams bad = rdscan::defaultParams();
    bad.kill = -1.0;
    REQUIRE(!rdscan::GridSimulator::step(grid, bad, 1), "invalid params must be rejected");
    REQUIRE(!rdscan::GridSimulator::step(grid, rdscan::defaultParams(), 0), "iterations < 1 must be rejected");
    REQUIRE(grid.snapshot().u == before.u, "rejected step must not touch U");

    rdscan::GridState empty;
    REQUIRE(!rdscan::GridSimulator::step(empty, rdscan::defaultParams(), 1), "empty grid must be rejected");
    std::cout << "[PASS] 1B step rejects invalid input without side effects\n";
}

static void runStepStaysBoundedAndWraps_1B() {
    rdscan::GridState grid(10);
    grid.fill(1.0f, 0.0f);
    // A single hot cell in the corner must leak to the opposite edges.
    grid.set(0, 0, 0.5f, 1.0f);

    rdscan::SimulationParams p = rdscan::defaultParams();
    p.dt = 2.0;
    REQUIRE(rdscan::GridSimulator::step(grid, p, 1), "step");
    REQUIRE(grid.v(9, 0) > 0.0f, "V must wrap across the left edge");
    REQUIRE(grid.v(0, 9) > 0.0f, "V must wrap across the top edge");
    REQUIRE(grid.v(9, 9) > 0.0f, "V must wrap across the corner");

    REQUIRE(rdscan::GridSimulator::step(grid, p, 50), "step x50");
    for (int y = 0; y < grid.size(); ++y) {
        for (int x = 0; x < grid.size(); ++x) {
            REQUIRE(grid.u(x, y) >= 0.0f && grid.u(x, y) <= 1.0f, "U out of [0,1]");
            REQUIRE(grid.v(x, y) >= 0.0f && grid.v(x, y) <= 1.0f, "V out of [0,1]");
        }
    }
    std::cout << "[PASS] 1B step clamps to [0,1] and wraps toroidally\n";
}

static void runSeedShape_1B() {
    const int n = 50;
    rdscan::GridState grid;
    std::mt19937 rng(99u);
    rdscan::GridSimulator::seed(grid, n, rng);
    REQUIRE(grid.size() == n, "seed allocates");

    for (int y = 0; y < n; ++y) {
        for (int x = 0; x < n; ++x) {
            REQUIRE(grid.u(x, y) > 0.98f - 1e-6f && grid.u(x, y) <= 1.0f, "U must be 1 - noise");
        }
    }
    // Centre is inside the disk, corner is outside.
    REQUIRE(grid.v(n / 2, n / 2) >= 0.6f && grid.v(n / 2, n / 2) <= 0.8f, "V raised inside the disk");
    REQUIRE(grid.v(0, 0) < 0.02f, "V near zero outside the disk");

    // Same seed, same grid.
    rdscan::GridState again;
    std::mt19937 rng2(99u);
    rdscan::GridSimulator::seed(again, n, rng2);
    REQUIRE(again.uField() == grid.uField() && again.vField() == grid.vField(), "seeding must be reproducible");

    const float* before = grid.uField().data();
    rdscan::GridSimulator::reset(grid, n, rng);
    REQUIRE(grid.uField().data() == before, "reset at the same size must keep the allocation");
    std::cout << "[PASS] 1B seed disk shape + reproducibility + reset in place\n";
}

// =======================
// Metrics
// =======================

static void runMetricsIdenticalSnapshots_2A() {
    rdscan::GridState grid(16);
    std::mt19937 rng(5u);
    rdscan::GridSimulator::seed(grid, 16, rng);
    const rdscan::Snapshot s = grid.snapshot();

    const rdscan::MetricsResult r = rdscan::MetricsExtractor::extract(s, &s);
    REQUIRE(r.metrics.activity == 0.0, "identical snapshots must give activity 0, got " << r.metrics.activity);
    REQUIRE(r.snapshot.u == s.u && r.snapshot.v == s.v, "snapshot must be handed back");

    const rdscan::MetricsResult first = rdscan::MetricsExtractor::extract(s);
    REQUIRE(first.metrics.activity == 0.0, "no previous snapshot gives activity 0");
    std::cout << "[PASS] 2A identical snapshots -> activity 0\n";
}

static void runMetricsKnownValues_2A() {
    // 2x2: U = {1,1,0,0}, V = {0,0,0,0}
    rdscan::Snapshot s;
    s.width = 2;
    s.height = 2;
    s.u = {1.0f, 1.0f, 0.0f, 0.0f};
    s.v = {0.0f, 0.0f, 0.0f, 0.0f};
    const rdscan::MetricsVector m = rdscan::MetricsExtractor::extract(s).metrics;
    REQUIRE(std::fabs(m.meanU - 0.5) < 1e-12, "meanU");
    REQUIRE(std::fabs(m.stdU - 0.5) < 1e-12, "population stdU must be 0.5, got " << m.stdU);
    REQUIRE(m.stdV == 0.0, "stdV");
    // Luminance clamps to 0 everywhere: one occupied bin.
    REQUIRE(m.entropy == 0.0, "single-bin entropy must be 0, got " << m.entropy);

    rdscan::Snapshot t = s;
    t.u = {0.0f, 0.0f, 0.0f, 0.0f};
    t.v = {0.0f, 1.0f, 0.0f, 1.0f};
    const rdscan::MetricsVector mt = rdscan::MetricsExtractor::extract(t, &s).metrics;
    // sum |dU| + |dV| = 2 + 2 = 4, / 4 cells * 0.5
    REQUIRE(std::fabs(mt.activity - 0.5) < 1e-12, "activity must be 0.5, got " << mt.activity);
    // Luminance {0,1,0,1}: two equally likely bins.
    REQUIRE(std::fabs(mt.entropy - 1.0) < 1e-12, "two-bin entropy must be 1 bit, got " << mt.entropy);
    std::cout << "[PASS] 2A metrics known values (population std, activity, entropy)\n";
}

static void runMetricsDimensionMismatch_2A() {
    rdscan::Snapshot a;
    a.width = 2;
    a.height = 2;
    a.u.assign(4, 0.5f);
    a.v.assign(4, 0.5f);
    rdscan::Snapshot b;
    b.width = 3;
    b.height = 3;
    b.u.assign(9, 0.0f);
    b.v.assign(9, 1.0f);
    const rdscan::MetricsVector m = rdscan::MetricsExtractor::extract(a, &b).metrics;
    REQUIRE(m.activity == 0.0, "mismatched previous must count as absent");

    const rdscan::MetricsVector avg = rdscan::MetricsExtractor::average({});
    REQUIRE(avg.meanU == 0.0 && avg.entropy == 0.0 && avg.activity == 0.0, "empty average must be all zero");
    std::cout << "[PASS] 2A dimension mismatch -> activity 0; empty average -> zero\n";
}

// =======================
// Classifier + scorer
// =======================

static void runClassifierScenarios_3A() {
    const rdscan::VitalityAssessment s = rdscan::classify(metrics(0.001, 0.9, 0.1, 0.1));
    REQUIRE(s.category == rdscan::VitalityCategory::Structured, "still + entropy>0.8 must be structured, got "
                                                                     << rdscan::vitalityName(s.category));

    const rdscan::VitalityAssessment c = rdscan::classify(metrics(0.2, 1.0, 0.05, 0.05));
    REQUIRE(c.category == rdscan::VitalityCategory::Chaotic, "activity>0.14 must be chaotic");

    const rdscan::VitalityAssessment d = rdscan::classify(metrics(0.001, 0.3, 0.05, 0.05));
    REQUIRE(d.category == rdscan::VitalityCategory::Dormant, "still and flat must be dormant");

    const rdscan::VitalityAssessment d2 = rdscan::classify(metrics(0.05, 0.5, 0.1, 0.1));
    REQUIRE(d2.category == rdscan::VitalityCategory::Dormant, "entropy<0.7 must be dormant");

    const rdscan::VitalityAssessment b = rdscan::classify(metrics(0.05, 2.4, 0.1, 0.1));
    REQUIRE(b.category == rdscan::VitalityCategory::Balanced, "mid-range metrics must be balanced");
    // 0.5*clamp(0.044/0.09) + 0.3 + 0.2
    REQUIRE(std::fabs(b.score - (0.5 * (0.044 / 0.09) + 0.5)) < 1e-9, "balanced score formula, got " << b.score);

    const rdscan::VitalityAssessment ch = rdscan::classify(metrics(0.01, 4.5, 0.1, 0.1));
    REQUIRE(ch.category == rdscan::VitalityCategory::Chaotic, "entropy>4.4 must be chaotic");
    std::cout << "[PASS] 3A classifier scenarios\n";
}

static void runClassifierPureAndBounded_3A() {
    const rdscan::MetricsVector m = metrics(0.03, 1.7, 0.2, 0.12);
    const rdscan::VitalityAssessment a = rdscan::classify(m);
    const rdscan::VitalityAssessment b = rdscan::classify(m);
    REQUIRE(a.category == b.category && a.score == b.score, "classify must be pure");

    const double acts[] = {0.0, 0.003, 0.006, 0.05, 0.14, 0.5, 3.0};
    const double ents[] = {0.0, 0.6, 0.8, 2.4, 4.4, 5.0};
    const double stds[] = {0.0, 0.03, 0.15, 0.32, 0.6};
    for (double act : acts) {
        for (double ent : ents) {
            for (double sd : stds) {
                const rdscan::VitalityAssessment v = rdscan::classify(metrics(act, ent, sd, sd));
                REQUIRE(inUnit(v.score), "score out of [0,1]: " << v.score);
            }
        }
    }
    std::cout << "[PASS] 3A classifier pure + score in [0,1]\n";
}

static void runScorerBounded_3B() {
    const rdscan::SpecialScorer scorer;
    REQUIRE(scorer.model().valid(), "default model must be valid");

    const double zero = scorer.score(rdscan::MetricsVector{}, rdscan::defaultParams());
    REQUIRE_FINITE(zero, "zero-metrics likelihood");
    REQUIRE(inUnit(zero), "all-zero metrics must score within [0,1]");

    const double big = scorer.score(metrics(1e6, 1e6, 1e6, 1e6), rdscan::defaultParams());
    const double small = scorer.score(metrics(-1e6, -1e6, -1e6, -1e6), rdscan::defaultParams());
    REQUIRE(inUnit(big) && inUnit(small), "extreme inputs must stay within [0,1]");

    REQUIRE(std::fabs(rdscan::logistic(0.0) - 0.5) < 1e-15, "logistic(0)");
    REQUIRE(rdscan::logistic(1000.0) == 1.0, "logistic must saturate without overflow");
    REQUIRE(rdscan::logistic(-1000.0) == 0.0, "logistic must saturate without overflow");

    // Zero std is floored, not divided by.
    rdscan::SpecialModel m;
    m.features = {"activity", "nonsense"};
    m.weights = {2.0, 5.0};
    m.bias = 0.0;
    m.means = {0.0, 0.0};
    m.stds = {0.0, 1.0};
    const rdscan::SpecialScorer flat(m);
    const double p = flat.score(rdscan::MetricsVector{}, rdscan::defaultParams());
    // activity 0 -> z 0; unknown feature -> default 0 -> z 0.
    REQUIRE(std::fabs(p - 0.5) < 1e-12, "zero-std feature + unknown feature must give 0.5, got " << p);
    REQUIRE(rdscan::missingFeatureDefault("gamma") == 1.0 && rdscan::missingFeatureDefault("kill") == 0.0,
            "missing defaults");
    std::cout << "[PASS] 3B special-likelihood bounded, epsilon-floored std, stable logistic\n";
}

static void runModelParsing_3B() {
    rdscan::SpecialModel m;
    std::string why;
    const std::string ok =
        "{\"features\":[\"entropy\"],\"weights\":[1.5],\"bias\":-0.5,\"means\":[1.0],\"stds\":[2.0]}";
    REQUIRE(rdscan::specialModelFromString(ok, m, &why), "well-formed model must parse: " << why);
    REQUIRE(m.features.size() == 1 && m.bias == -0.5, "parsed fields");

    const std::string mismatch =
        "{\"features\":[\"entropy\",\"kill\"],\"weights\":[1.5],\"bias\":0,\"means\":[1.0],\"stds\":[2.0]}";
    REQUIRE(!rdscan::specialModelFromString(mismatch, m, &why), "length mismatch must be rejected");
    REQUIRE(!rdscan::specialModelFromString("{not json", m, &why), "parse errors must be rejected");
    REQUIRE(!rdscan::specialModelFromString("[1,2]", m, &why), "non-object root must be rejected");

    // Serialized default model reads back with the same coefficients.
    const Json::Value root = rdscan::specialModelToJson(rdscan::defaultSpecialModel());
    rdscan::SpecialModel back;
    REQUIRE(rdscan::specialModelFromJson(root, back, &why), "default model JSON must parse: " << why);
    REQUIRE(back.features == rdscan::defaultSpecialModel().features, "feature order preserved");
    std::cout << "[PASS] 3B model artifact parsing + rejection\n";
}

static void runShippedModelMatchesDefault_3B() {
    const rdscan::SpecialModel& def = rdscan::defaultSpecialModel();
    rdscan::SpecialModel file;
    std::string why;
    const std::string path = std::string(RDSCAN_DATA_DIR) + "/special-model.json";
    REQUIRE(rdscan::loadSpecialModel(path, file, &why), "shipped model must load: " << path << ": " << why);
    REQUIRE(file.features == def.features, "shipped feature order matches the compiled-in model");
    REQUIRE(file.weights.size() == def.weights.size() && file.means.size() == def.means.size() &&
                file.stds.size() == def.stds.size(),
            "shipped array lengths");
    REQUIRE(std::fabs(file.bias - def.bias) < 1e-12, "bias");
    for (std::size_t i = 0; i < def.features.size(); ++i) {
        REQUIRE(std::fabs(file.weights[i] - def.weights[i]) < 1e-12, "weight " << def.features[i]);
        REQUIRE(std::fabs(file.means[i] - def.means[i]) < 1e-12, "mean " << def.features[i]);
        REQUIRE(std::fabs(file.stds[i] - def.stds[i]) < 1e-12, "std " << def.features[i]);
    }
    std::cout << "[PASS] 3B shipped model file equals the compiled-in coefficients\n";
}

// =======================
// Evaluator
// =======================

static rdscan::EvaluationOptions smallEvaluation(int total, int interval) {
    rdscan::EvaluationOptions o;
    o.resolution = 16;
    o.totalIterations = total;
    o.sampleInterval = interval;
    o.seed = 11u;
    return o;
}

static void runEvaluatorSingleFinalSample_4A() {
    const rdscan::Evaluator ev(smallEvaluation(40, 40));
    const rdscan::EvaluationResult r = ev.evaluateOne(rdscan::defaultParams());
    REQUIRE(r.valid, "default params must evaluate");
    REQUIRE(r.samples.size() == 1, "40/40 must give exactly one sample, got " << r.samples.size());
    requireMetricsEqual(r.average, r.samples.front(), "single-sample average");

    REQUIRE(rdscan::Evaluator::isSampleStep(37, 37, 10), "final step always samples");
    REQUIRE(rdscan::Evaluator::isSampleStep(20, 37, 10), "interval step samples");
    REQUIRE(!rdscan::Evaluator::isSampleStep(21, 37, 10), "off-interval step does not sample");
    std::cout << "[PASS] 4A evaluator 40/40 -> one sample, average == sample\n";
}

static void runEvaluatorDeterministicAndProgress_4A() {
    rdscan::Evaluator ev(smallEvaluation(20, 5));
    rdscan::SimulationParams bad = rdscan::defaultParams();
    bad.du = -1.0;
    const std::vector<rdscan::SimulationParams> list{rdscan::defaultParams(), bad, rdscan::defaultParams()};

    std::vector<std::pair<int, int>> calls;
    const std::vector<rdscan::EvaluationResult> rs =
        ev.evaluate(list, [&](int done, int total) { calls.emplace_back(done, total); });

    REQUIRE(rs.size() == 3, "one result per parameter set");
    REQUIRE(rs[0].valid && rs[0].samples.size() == 4, "20/5 must give 4 samples");
    REQUIRE(!rs[1].valid && !rs[1].error.empty(), "invalid params must be reported, not thrown");
    REQUIRE(rs[1].samples.empty(), "invalid params must not produce samples");
    REQUIRE(rs[2].valid, "evaluation must continue after a rejected set");
    requireMetricsEqual(rs[0].average, rs[2].average, "fresh seeded grid per candidate");

    REQUIRE(calls.size() >= 3, "progress at least once per parameter set");
    for (std::size_t i = 1; i < calls.size(); ++i) {
        REQUIRE(calls[i].first >= calls[i - 1].first, "progress must not go backwards");
    }
    REQUIRE(calls.back().first == 3 && calls.back().second == 3, "final progress (3,3)");
    std::cout << "[PASS] 4A evaluator deterministic per candidate + progress + invalid params\n";
}

static void runEvaluatorFailedReadsExcluded_4A() {
    rdscan::Evaluator ev(smallEvaluation(40, 10));
    int call = 0;
    ev.setSnapshotReader([&call](const rdscan::GridState& state, rdscan::Snapshot& out) {
        ++call;
        if (call % 2 == 1) return false;
        return rdscan::Evaluator::readSnapshot(state, out);
    });
    const rdscan::EvaluationResult r = ev.evaluateOne(rdscan::defaultParams());
    REQUIRE(r.valid, "failed reads must not invalidate the run");
    REQUIRE(r.failedSamples == 2, "two of four reads fail, got " << r.failedSamples);
    REQUIRE(r.samples.size() == 2, "failed reads excluded from samples");
    const rdscan::MetricsVector avg = rdscan::MetricsExtractor::average(r.samples);
    requireMetricsEqual(avg, r.average, "average over successful samples only");

    ev.setSnapshotReader([](const rdscan::GridState&, rdscan::Snapshot&) { return false; });
    const rdscan::EvaluationResult none = ev.evaluateOne(rdscan::defaultParams());
    REQUIRE(none.samples.empty() && none.failedSamples == 4, "all reads failed");
    REQUIRE(none.average.meanU == 0.0 && none.average.entropy == 0.0, "no samples -> zero average");
    std::cout << "[PASS] 4A evaluator excludes failed snapshot reads\n";
}

// =======================
// Sampling
// =======================

static void runSamplersStayInRange_5A() {
    std::mt19937 rng(123u);
    const rdscan::SamplingPolicy policy;
    const std::vector<rdscan::SimulationParams> specials = rdscan::FeedbackStore::withCuratedSeeds().specialParams();
    REQUIRE(specials.size() >= static_cast<std::size_t>(policy.minSpecials), "curated seeds provide enough specials");

    for (int i = 0; i < 300; ++i) {
        requireWithinValidRanges(rdscan::sampleGoldilocks(rng), "goldilocks");
        requireWithinValidRanges(rdscan::sampleUniform(rng, policy), "uniform");
        requireWithinValidRanges(rdscan::samplePerturbed(specials[i % specials.size()], rng, policy), "perturbed");
    }

    // Goldilocks feed stays inside its band.
    for (int i = 0; i < 200; ++i) {
        const rdscan::SimulationParams p = rdscan::sampleGoldilocks(rng);
        REQUIRE(p.feed >= 0.001 && p.feed <= 0.1, "goldilocks feed outside band");
        REQUIRE(p.dt >= 1.3 && p.dt <= 1.7, "goldilocks dt outside band");
    }
    std::cout << "[PASS] 5A samplers stay within valid ranges\n";
}

static void runSamplingMixture_5A() {
    std::mt19937 rng(77u);
    const rdscan::SamplingPolicy policy;
    const std::vector<rdscan::SimulationParams> few(2, rdscan::defaultParams());
    int goldilocks = 0;
    for (int i = 0; i < 400; ++i) {
        rdscan::SampleStrategy used = rdscan::SampleStrategy::Uniform;
        rdscan::sampleCandidate(rng, few, policy, &used);
        REQUIRE(used != rdscan::SampleStrategy::PerturbSpecial, "perturbation needs at least 5 specials");
        if (used == rdscan::SampleStrategy::Goldilocks) ++goldilocks;
    }
    REQUIRE(goldilocks > 120 && goldilocks < 280, "goldilocks share far from 0.5: " << goldilocks);

    const std::vector<rdscan::SimulationParams> many(6, rdscan::defaultParams());
    int perturbed = 0;
    for (int i = 0; i < 400; ++i) {
        rdscan::SampleStrategy used = rdscan::SampleStrategy::Uniform;
        rdscan::sampleCandidate(rng, many, policy, &used);
        if (used == rdscan::SampleStrategy::PerturbSpecial) ++perturbed;
    }
    REQUIRE(perturbed > 60, "perturbation should fire with enough specials: " << perturbed);

    // Same seed, same sequence.
    std::mt19937 a(5u);
    std::mt19937 b(5u);
    const rdscan::SimulationParams pa = rdscan::sampleCandidate(a, many, policy);
    const rdscan::SimulationParams pb = rdscan::sampleCandidate(b, many, policy);
    REQUIRE(pa.du == pb.du && pa.feed == pb.feed && pa.invert == pb.invert, "sampling must be reproducible");
    std::cout << "[PASS] 5A sampling mixture policy\n";
}

// =======================
// Feedback store
// =======================

static void runAutoTagIdempotentAndRespectsUser_6A() {
    rdscan::FeedbackStore store;
    const rdscan::AutoTagPolicy policy;

    const rdscan::Candidate hot = candidateWithLikelihood("scan-1", 0.5);
    REQUIRE(store.applyAutoTag(hot, policy, "2025-01-01T00:00:00.000Z"), "first auto-tag writes");
    const rdscan::FeedbackRecord first = *store.find("scan-1");
    REQUIRE(first.label == rdscan::FeedbackLabel::Special, "likelihood 0.5 -> special");
    REQUIRE(first.source == rdscan::FeedbackSource::AutoTag, "provenance auto-tag");

    REQUIRE(!store.applyAutoTag(hot, policy, "2025-06-01T00:00:00.000Z"), "second pass must not rewrite");
    const rdscan::FeedbackRecord second = *store.find("scan-1");
    REQUIRE(second.notedAt == first.notedAt && second.label == first.label, "auto-tag must not flap");

    const rdscan::Candidate cold = candidateWithLikelihood("scan-2", 0.01);
    REQUIRE(store.applyAutoTag(cold, policy, "t"), "low likelihood writes normal");
    REQUIRE(store.find("scan-2")->label == rdscan::FeedbackLabel::Normal, "likelihood 0.01 -> normal");

    const rdscan::Candidate mid = candidateWithLikelihood("scan-3", 0.1);
    REQUIRE(!store.applyAutoTag(mid, policy, "t"), "undecided likelihood leaves no record");
    REQUIRE(store.find("scan-3") == nullptr, "undecided must stay unlabeled");

    store.labelByUser(cold, rdscan::FeedbackLabel::Special, "u");
    REQUIRE(!store.applyAutoTag(cold, policy, "t2"), "auto-tag must not overwrite a user label");
    REQUIRE(store.find("scan-2")->label == rdscan::FeedbackLabel::Special, "user label kept");
    REQUIRE(store.find("scan-2")->source == rdscan::FeedbackSource::User, "user provenance kept");

    rdscan::AutoTagPolicy off = policy;
    off.enabled = false;
    REQUIRE(!store.applyAutoTag(candidateWithLikelihood("scan-4", 0.9), off, "t"), "disabled policy writes nothing");

    // A threshold change may flip an auto record.
    rdscan::AutoTagPolicy strict = policy;
    strict.specialThreshold = 0.9;
    strict.normalThreshold = 0.6;
    REQUIRE(store.applyAutoTag(hot, strict, "t3"), "auto record follows new thresholds");
    REQUIRE(store.find("scan-1")->label == rdscan::FeedbackLabel::Normal, "re-tagged normal");
    std::cout << "[PASS] 6A auto-tag idempotent + never overwrites user labels\n";
}

static void runUserLabelSupersedesAndKeepsNote_6A() {
    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    REQUIRE(store.size() == 9, "nine curated seeds");
    REQUIRE(store.find("manual-2")->label == rdscan::FeedbackLabel::Normal, "manual-2 normal");
    REQUIRE(store.find("manual-1")->source == rdscan::FeedbackSource::Manual, "curated provenance");
    REQUIRE(store.manualSpecialRecords().size() == 6, "six curated specials");

    REQUIRE(store.setNote("manual-1", "spots"), "note on existing record");
    rdscan::Candidate c;
    c.id = "manual-1";
    store.labelByUser(c, rdscan::FeedbackLabel::Normal, "later");
    const rdscan::FeedbackRecord* r = store.find("manual-1");
    REQUIRE(r->source == rdscan::FeedbackSource::User && r->label == rdscan::FeedbackLabel::Normal,
            "user label supersedes a curated record");
    REQUIRE(r->note && *r->note == "spots", "relabel keeps the note");
    REQUIRE(!store.setNote("missing", "x"), "note on unknown id fails");
    std::cout << "[PASS] 6A user labels supersede any provenance and keep notes\n";
}

static void runBookmarkSync_6B() {
    rdscan::FeedbackStore store;
    rdscan::BookmarkEntry e;
    e.id = "b1";
    e.name = "Spots";
    e.params = rdscan::defaultParams();
    e.savedAt = "2025-02-02T10:00:00.000Z";
    e.metrics = metrics(0.001, 0.9, 0.1, 0.1);
    e.note = "keep";
    store.syncBookmarks({e});

    const rdscan::FeedbackRecord* r = store.find("codex-b1");
    REQUIRE(r != nullptr, "bookmark must yield a codex record");
    REQUIRE(r->label == rdscan::FeedbackLabel::Special && r->source == rdscan::FeedbackSource::Manual,
            "bookmark record is a manual special");
    REQUIRE(r->classification == rdscan::VitalityCategory::Structured, "classification recomputed");
    REQUIRE(r->note && *r->note == "keep", "bookmark note carried");

    store.labelByUser(candidateWithLikelihood("scan-9", 0.3), rdscan::FeedbackLabel::Normal, "t");
    store.syncBookmarks({});
    REQUIRE(store.find("codex-b1") == nullptr, "removed bookmark drops its record");
    REQUIRE(store.find("scan-9") != nullptr, "other records untouched by bookmark sync");
    std::cout << "[PASS] 6B bookmark-derived records follow the bookmark list\n";
}

static void runFeedbackJsonExportImport_6C() {
    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    store.labelByUser(candidateWithLikelihood("1700-0-1", 0.4), rdscan::FeedbackLabel::Special, "t");
    REQUIRE(store.setNote("1700-0-1", "stripes"), "note");

    const Json::Value exported = store.toJson();
    REQUIRE(exported.isArray() && exported.size() == store.size(), "export is a flat array of every record");
    for (Json::ArrayIndex i = 1; i < exported.size(); ++i) {
        REQUIRE(exported[i - 1]["id"].asString() < exported[i]["id"].asString(), "export ordered by id");
    }
    const Json::Value& first = exported[0u];
    REQUIRE(first.isMember("params") && first.isMember("metrics") && first.isMember("classification") &&
                first.isMember("source") && first.isMember("notedAt") && first.isMember("score"),
            "record shape");

    rdscan::FeedbackStore back;
    std::string why;
    int skipped = -1;
    REQUIRE(back.mergeJson(exported, &why, &skipped), "import: " << why);
    REQUIRE(skipped == 0 && back.size() == store.size(), "all records imported");
    const rdscan::FeedbackRecord* r = back.find("1700-0-1");
    REQUIRE(r && r->label == rdscan::FeedbackLabel::Special && r->note && *r->note == "stripes", "record round-trips");
    REQUIRE(r->params.feed == store.find("1700-0-1")->params.feed, "params carried");

    // Legacy provenance, forced curated normals and bad rows.
    Json::Value legacy(Json::arrayValue);
    Json::Value a(Json::objectValue);
    a["id"] = "old-1";
    a["label"] = "special";
    a["source"] = "auto-scan";
    legacy.append(a);
    Json::Value b(Json::objectValue);
    b["id"] = "manual-4";
    b["label"] = "special";
    b["source"] = "manual";
    legacy.append(b);
    legacy.append(Json::Value("garbage"));
    Json::Value c(Json::objectValue);
    c["id"] = "old-2";
    c["label"] = "maybe";
    legacy.append(c);

    rdscan::FeedbackStore merged;
    REQUIRE(merged.mergeJson(legacy, &why, &skipped), "legacy import");
    REQUIRE(skipped == 2, "bad rows counted, got " << skipped);
    REQUIRE(merged.find("old-1")->source == rdscan::FeedbackSource::User, "'auto-scan' reads as user");
    REQUIRE(merged.find("old-1")->params.gamma == 1.0, "missing gamma defaults to 1");
    REQUIRE(merged.find("manual-4")->label == rdscan::FeedbackLabel::Normal, "manual-4 always normal");

    REQUIRE(!merged.mergeJson(Json::Value(Json::objectValue), &why), "non-array root rejected");
    std::cout << "[PASS] 6C feedback JSON export/import\n";
}

// =======================
// Auto-scan
// =======================

static void runScanCompletesAndRanks_7A() {
    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), smallScanConfig());
    scanner.setClock(&fixedTime);

    std::vector<double> progress;
    REQUIRE(scanner.requestScan(), "scan accepted from idle");
    REQUIRE(scanner.scanning(), "scanning after request");
    REQUIRE(scanner.plannedBatches() == 2, "ceil(3/2) batches planned");
    scanner.run([&](double f) { progress.push_back(f); });

    REQUIRE(scanner.state() == rdscan::ScanState::Idle, "back to idle");
    REQUIRE(scanner.batchesRun() == 2, "two batches run");
    REQUIRE(scanner.queue().size() == 4, "two batches of two");
    REQUIRE(scanner.progress() == 1.0, "progress 1 on completion");
    REQUIRE(!progress.empty() && progress.back() == 1.0, "last progress report is 1");
    for (std::size_t i = 1; i < progress.size(); ++i) {
        REQUIRE(progress[i] >= progress[i - 1], "progress must be monotone");
        REQUIRE(inUnit(progress[i]), "progress within [0,1]");
    }

    const std::vector<rdscan::Candidate>& q = scanner.queue();
    for (std::size_t i = 0; i < q.size(); ++i) {
        REQUIRE(q[i].vitalityScore && q[i].specialLikelihood, "scores filled");
        REQUIRE(std::fabs(q[i].score - rdscan::blendedScore(*q[i].vitalityScore, *q[i].specialLikelihood)) < 1e-12,
                "blended score");
        REQUIRE(q[i].id.rfind("1700000000123-", 0) == 0, "id carries the scan start time: " << q[i].id);
        if (i > 0) REQUIRE(q[i - 1].score >= q[i].score, "queue sorted descending");
    }

    // Auto-tag outcome follows the policy for every new candidate.
    const rdscan::AutoTagPolicy policy;
    for (const auto& c : q) {
        const rdscan::FeedbackRecord* r = store.find(c.id);
        const std::optional<rdscan::FeedbackLabel> want = rdscan::autoTagLabel(*c.specialLikelihood, policy);
        if (want) {
            REQUIRE(r && r->label == *want && r->source == rdscan::FeedbackSource::AutoTag, "auto-tag applied");
        } else {
            REQUIRE(r == nullptr, "undecided candidates stay unlabeled");
        }
    }
    std::cout << "[PASS] 7A scan completes, ranks, auto-tags, reports monotone progress\n";
}

static void runScanReentryIsNoOp_7A() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), smallScanConfig());
    REQUIRE(scanner.requestScan(), "first request");
    REQUIRE(scanner.step(), "one candidate evaluated, more to do");
    const double p = scanner.progress();
    const int planned = scanner.plannedBatches();

    REQUIRE(!scanner.requestScan(), "request while scanning is a no-op");
    REQUIRE(scanner.scanning() && scanner.progress() == p && scanner.plannedBatches() == planned,
            "reentry must not reset the scan");
    REQUIRE(!scanner.setConfig(smallScanConfig()), "config is frozen while scanning");
    scanner.run();
    REQUIRE(!scanner.scanning(), "scan finishes");
    std::cout << "[PASS] 7A scan request while scanning is a silent no-op\n";
}

static void runScanFinishesImmediatelyWhenFull_7A() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), smallScanConfig());
    for (int i = 0; i < 3; ++i) {
        rdscan::Candidate c;
        c.id = "restored-" + std::to_string(i);
        c.metrics = metrics(0.02 * (i + 1), 2.0, 0.1, 0.1);
        scanner.enqueue(c);
    }
    REQUIRE(scanner.queue().front().vitalityScore && scanner.queue().front().specialLikelihood,
            "enqueue normalizes missing fields");

    REQUIRE(scanner.requestScan(), "request accepted");
    REQUIRE(!scanner.scanning(), "target already met: no scan");
    REQUIRE(scanner.queue().size() == 3 && scanner.progress() == 1.0, "queue unchanged, progress complete");
    REQUIRE(!scanner.step(), "nothing to step");

    // With the filter on, nothing passes a threshold of 1.1, so the scan runs.
    rdscan::VisibilityFilter filter;
    filter.enabled = true;
    filter.threshold = 1.1;
    scanner.setFilter(filter);
    REQUIRE(scanner.visibleCount() == 0, "filter hides everything");
    REQUIRE(scanner.requestScan() && scanner.scanning(), "scan runs when the visible queue is short");
    REQUIRE(scanner.plannedBatches() == 2, "ceil(3/2) batches planned again");
    scanner.run();
    REQUIRE(scanner.batchesRun() == 2 && scanner.queue().size() == 7, "hits the planned ceiling");
    std::cout << "[PASS] 7A pre-filled queue finishes immediately; filtered queue scans\n";
}

static void runScanBatchCeiling_7A() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanConfig cfg = smallScanConfig();
    cfg.targetQueueSize = 50;
    cfg.maxBatches = 2;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), cfg);
    REQUIRE(scanner.requestScan(), "request");
    REQUIRE(scanner.plannedBatches() == 2, "capped at the batch ceiling");
    scanner.run();
    REQUIRE(scanner.queue().size() == 4, "ceiling bounds the work");
    REQUIRE(scanner.visibleCount() < cfg.targetQueueSize, "target not reached");
    std::cout << "[PASS] 7A batch ceiling bounds a scan\n";
}

static void runScanCancellation_7A() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanConfig cfg = smallScanConfig();
    cfg.batchSize = 3;
    cfg.targetQueueSize = 12;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), cfg);
    REQUIRE(scanner.requestScan(), "request");
    REQUIRE(scanner.step(), "first candidate");
    scanner.cancel();
    REQUIRE(!scanner.step(), "cancel observed before the next candidate");
    REQUIRE(scanner.state() == rdscan::ScanState::Idle && scanner.cancelled(), "idle and flagged cancelled");
    REQUIRE(scanner.queue().size() == 1, "completed candidate kept");

    // Cancellation through run(): stop after two polls.
    int polls = 0;
    REQUIRE(scanner.requestScan(), "new scan after cancel");
    REQUIRE(!scanner.cancelled(), "cancel flag cleared on a new scan");
    scanner.run(rdscan::AutoScanner::ProgressFn(), [&polls] { return ++polls > 2; });
    REQUIRE(scanner.cancelled(), "run observed the cancel signal");
    REQUIRE(scanner.queue().size() == 3, "two more candidates completed before the cancel");
    std::cout << "[PASS] 7A cancellation keeps completed candidates and returns to idle\n";
}

static void runScanIdsUniqueAcrossScans_7A() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanConfig cfg = smallScanConfig();
    cfg.targetQueueSize = 12;
    // Everything gets an auto-tag record, so a reused id would overwrite one.
    cfg.autoTag.specialThreshold = 0.0;
    cfg.autoTag.normalThreshold = 0.0;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(), cfg);
    scanner.setClock(&fixedTime);

    for (int scan = 0; scan < 3; ++scan) {
        REQUIRE(scanner.requestScan(), "request " << scan);
        REQUIRE(scanner.step(), "one candidate in scan " << scan);
        scanner.cancel();
        REQUIRE(!scanner.step(), "cancel observed in scan " << scan);
    }
    const std::vector<rdscan::Candidate>& q = scanner.queue();
    REQUIRE(q.size() == 3, "one candidate kept per cancelled scan");
    std::set<std::string> ids;
    for (const auto& c : q) {
        REQUIRE(c.id.rfind("1700000000123-", 0) == 0, "id carries the scan start time: " << c.id);
        ids.insert(c.id);
        const rdscan::FeedbackRecord* r = store.find(c.id);
        REQUIRE(r && r->params.feed == c.params.feed && r->params.kill == c.params.kill,
                "auto-tag record belongs to its own candidate: " << c.id);
    }
    REQUIRE(ids.size() == q.size(), "same clock reading, still unique ids");
    REQUIRE(store.size() == q.size(), "one record per candidate");

    // A fresh scanner over a store that already holds those ids must not reuse them.
    rdscan::AutoScanner again(store, rdscan::SpecialScorer(), cfg);
    again.setClock(&fixedTime);
    REQUIRE(again.requestScan() && again.step(), "second scanner evaluates");
    again.cancel();
    REQUIRE(!again.step(), "second scanner cancelled");
    REQUIRE(again.queue().size() == 1 && ids.count(again.queue().front().id) == 0,
            "id not taken from stored records: " << again.queue().front().id);
    REQUIRE(store.size() == q.size() + 1, "stored records are never replaced by a new scan");
    std::cout << "[PASS] 7A candidate ids stay unique across scans sharing a clock reading\n";
}

static void runQueueProjectionsAndActions_7B() {
    rdscan::FeedbackStore store;
    rdscan::AutoScanner scanner(store);
    scanner.setClock(&fixedTime);
    scanner.enqueue(candidateWithLikelihood("a-0-0001", 0.5));
    scanner.enqueue(candidateWithLikelihood("a-0-0002", 0.1));
    scanner.enqueue(candidateWithLikelihood("a-0-0003", 0.01));

    REQUIRE(scanner.visibleQueue().size() == 3, "filter off shows all");
    rdscan::VisibilityFilter filter;
    filter.enabled = true;
    filter.threshold = 0.2;
    scanner.setFilter(filter);
    REQUIRE(scanner.visibleQueue().size() == 1, "filter keeps likelihood >= 0.2");
    const std::vector<rdscan::Candidate> undecided = scanner.undecidedQueue();
    REQUIRE(undecided.size() == 1 && undecided.front().id == "a-0-0002", "undecided between thresholds");
    REQUIRE(scanner.queue().size() == 3, "projections never mutate the queue");

    REQUIRE(scanner.retagQueue() == 2, "re-tag writes the two decided candidates");
    REQUIRE(scanner.retagQueue() == 0, "re-tag is idempotent");

    bool replayed = false;
    scanner.setReplaySink([&](const rdscan::SimulationParams&) { replayed = true; });
    REQUIRE(scanner.replay("a-0-0002") && replayed, "replay signals the canvas");
    REQUIRE(scanner.queue().size() == 3, "replay leaves the queue alone");

    REQUIRE(scanner.label("a-0-0002", rdscan::FeedbackLabel::Special), "label");
    REQUIRE(store.find("a-0-0002")->source == rdscan::FeedbackSource::User, "label writes a user record");

    std::vector<rdscan::BookmarkEntry> emitted;
    scanner.setBookmarkSink([&](const rdscan::BookmarkEntry& e) { emitted.push_back(e); });
    const std::optional<rdscan::BookmarkEntry> adopted = scanner.adopt("a-0-0001", 384);
    REQUIRE(adopted && emitted.size() == 1, "adopt emits one bookmark");
    REQUIRE(adopted->name == "Auto Seed 0001", "bookmark name from the id tail, got " << adopted->name);
    REQUIRE(adopted->resolution == 384 && adopted->metrics, "bookmark carries resolution and metrics");
    REQUIRE(adopted->id == "1700000000123-a-0-0001", "bookmark id");
    REQUIRE(scanner.findCandidate("a-0-0001") == nullptr, "adopt removes from queue");

    REQUIRE(scanner.discard("a-0-0003") && scanner.queue().size() == 1, "discard removes");
    REQUIRE(!scanner.discard("a-0-0003"), "discarding twice fails");
    REQUIRE(store.find("a-0-0003") != nullptr, "discard keeps feedback records");
    REQUIRE(!scanner.adopt("missing", 512), "adopt of unknown id");
    std::cout << "[PASS] 7B queue projections + user actions\n";
}

// =======================
// Heatmap
// =======================

static rdscan::HeatmapAxis axis(rdscan::ParamKey key, double mn, double mx, int bins) {
    rdscan::HeatmapAxis a;
    a.key = key;
    a.min = mn;
    a.max = mx;
    a.bins = bins;
    return a;
}

static rdscan::SimulationParams feedKill(double feed, double kill) {
    rdscan::SimulationParams p = rdscan::defaultParams();
    p.feed = feed;
    p.kill = kill;
    return p;
}

static void runHeatmapCountsAndNormalization_8A() {
    const rdscan::HeatmapAxis x = axis(rdscan::ParamKey::Feed, 0.0, 0.1, 5);
    const rdscan::HeatmapAxis y = axis(rdscan::ParamKey::Kill, 0.0, 0.1, 5);
    const std::vector<rdscan::SimulationParams> pts{
        feedKill(0.01, 0.01), feedKill(0.011, 0.012), feedKill(0.05, 0.05),
        feedKill(0.09, 0.01), feedKill(0.2, 0.05),  // out of range
        feedKill(0.05, -0.1),                       // out of range
    };
    const std::optional<rdscan::Heatmap> h = rdscan::buildHeatmap(pts, x, y);
    REQUIRE(h.has_value(), "in-range data must produce a heatmap");
    REQUIRE(h->width == 5 && h->height == 5 && h->grid.size() == 25, "grid shape");
    int sum = 0;
    double maxNorm = 0.0;
    for (const auto& cell : h->grid) {
        sum += cell.count;
        maxNorm = std::max(maxNorm, cell.normalized);
    }
    REQUIRE(sum == 4 && h->total == 4, "count sum equals accepted records");
    REQUIRE(h->maxCount == 2 && h->at(0, 0).count == 2, "two records share the first cell");
    REQUIRE(h->at(0, 0).normalized == 1.0 && maxNorm == 1.0, "max cell intensity exactly 1");
    REQUIRE(h->at(2, 2).normalized == 0.5, "single cell at half intensity");
    REQUIRE(h->ticksX.size() == 5 && h->ticksX.front() == "0.010", "tick = bin centre, 3 decimals below 1");
    REQUIRE(h->labelX == "feed", "default label is the key name");

    const rdscan::HeatmapAxis big = axis(rdscan::ParamKey::Contrast, 1.5, 5.0, 7);
    REQUIRE(rdscan::heatmapTicks(big).front() == "1.75", "2 decimals at or above 1");
    std::cout << "[PASS] 8A heatmap counts sum to accepted records, max cell == 1\n";
}

static void runHeatmapBoundaryInclusive_8A() {
    const rdscan::HeatmapAxis x = axis(rdscan::ParamKey::Feed, 0.0, 0.1, 6);
    const rdscan::HeatmapAxis y = axis(rdscan::ParamKey::Kill, 0.02, 0.08, 6);
    const std::optional<rdscan::Heatmap> h = rdscan::buildHeatmap({feedKill(0.1, 0.08)}, x, y);
    REQUIRE(h.has_value(), "value == max is accepted");
    REQUIRE(h->at(5, 5).count == 1, "value == max lands in the last bin");

    const std::optional<rdscan::Heatmap> lo = rdscan::buildHeatmap({feedKill(0.0, 0.02)}, x, y);
    REQUIRE(lo && lo->at(0, 0).count == 1, "value == min lands in the first bin");
    std::cout << "[PASS] 8A heatmap inclusive range, boundary -> last bin\n";
}

static void runHeatmapBinIndexDegenerateAxes_8A() {
    REQUIRE(rdscan::heatmapBinIndex(axis(rdscan::ParamKey::Feed, 0.0, 0.1, 0), 0.05) == 0, "no bins -> 0");
    REQUIRE(rdscan::heatmapBinIndex(axis(rdscan::ParamKey::Feed, 0.0, 0.1, -3), 0.05) == 0, "negative bins -> 0");
    REQUIRE(rdscan::heatmapBinIndex(axis(rdscan::ParamKey::Feed, 0.1, 0.1, 6), 0.1) == 0, "empty range -> 0");
    REQUIRE(rdscan::heatmapBinIndex(axis(rdscan::ParamKey::Feed, 0.2, 0.1, 6), 0.15) == 0, "inverted range -> 0");
    const rdscan::HeatmapAxis x = axis(rdscan::ParamKey::Feed, 0.0, 0.1, 6);
    REQUIRE(rdscan::heatmapBinIndex(x, std::numeric_limits<double>::quiet_NaN()) == 0, "NaN -> 0");
    REQUIRE(rdscan::heatmapBinIndex(x, -1.0) == 0, "below range clamps to first bin");
    REQUIRE(rdscan::heatmapBinIndex(x, 1.0) == 5, "above range clamps to last bin");
    REQUIRE(rdscan::heatmapBinIndex(x, 0.1) == 5, "max lands in last bin");
    std::cout << "[PASS] 8A bin index on degenerate axes stays in range\n";
}

static void runHeatmapNoData_8A() {
    const rdscan::HeatmapAxis x = axis(rdscan::ParamKey::Feed, 0.0, 0.1, 6);
    const rdscan::HeatmapAxis y = axis(rdscan::ParamKey::Kill, 0.0, 0.1, 6);
    const std::vector<rdscan::SimulationParams> one{feedKill(0.05, 0.05)};

    REQUIRE(!rdscan::buildHeatmap(std::vector<rdscan::SimulationParams>{}, x, y), "no records -> none");
    REQUIRE(!rdscan::buildHeatmap(one, axis(rdscan::ParamKey::Feed, 0.0, 0.1, 0), y), "zero bins -> none");
    REQUIRE(!rdscan::buildHeatmap(one, x, axis(rdscan::ParamKey::Kill, 0.1, 0.1, 6)), "empty range -> none");
    REQUIRE(!rdscan::buildHeatmap(one, x, axis(rdscan::ParamKey::Kill, 0.2, 0.1, 6)), "inverted range -> none");
    REQUIRE(!rdscan::buildHeatmap({feedKill(0.5, 0.5)}, x, y), "nothing in range -> none");

    const rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    const std::optional<rdscan::Heatmap> fromStore = rdscan::buildHeatmap(
        store.manualSpecialRecords(), axis(rdscan::ParamKey::Feed, 0.001, 0.1, 6),
        axis(rdscan::ParamKey::Kill, 0.021, 0.077, 6));
    REQUIRE(fromStore && fromStore->total == 6, "curated specials all fall inside the goldilocks bounds");
    std::cout << "[PASS] 8A heatmap degenerate input -> explicit no-data\n";
}

// =======================
// Live session
// =======================

static void runSessionContract_9A() {
    rdscan::SimulationSession session(32, 4u);
    REQUIRE(session.resolution() == 32 && session.grid().size() == 32, "session owns a seeded grid");
    REQUIRE(session.params().feed == 0.06, "session starts at defaults");

    rdscan::SimulationParams bad = rdscan::defaultParams();
    bad.dt = -1.0;
    std::string why;
    REQUIRE(!session.applyParameters(bad, &why) && !why.empty(), "invalid params rejected with a reason");
    REQUIRE(session.params().dt == 1.0, "rejected params leave the session unchanged");

    REQUIRE(session.setStepsPerFrame(4), "speed 4");
    REQUIRE(!session.setStepsPerFrame(0), "speed 0 rejected");
    REQUIRE(session.advanceFrame() == 4 && session.iterations() == 4, "frame steps stepsPerFrame iterations");

    const rdscan::MetricsVector first = session.collectMetrics();
    REQUIRE(first.activity == 0.0, "first collection has no previous snapshot");
    session.advanceFrame();
    const rdscan::MetricsVector second = session.collectMetrics();
    REQUIRE(second.activity > 0.0, "collection after stepping sees activity");

    session.setRunning(false);
    const rdscan::Snapshot paused = session.currentSnapshot();
    REQUIRE(session.advanceFrame() == 0, "paused session does not step");
    REQUIRE(session.currentSnapshot().v == paused.v, "paused grid unchanged");

    rdscan::SessionLoadRequest req;
    req.params = rdscan::defaultParams();
    req.params.feed = 0.03;
    req.resolution = 48;
    session.setRunning(true);
    REQUIRE(session.loadBookmark(req), "load bookmark");
    REQUIRE(!session.running() && session.resolution() == 48 && session.params().feed == 0.03,
            "load applies, resizes and pauses");
    REQUIRE(session.iterations() == 0 && session.collectMetrics().activity == 0.0, "load resets state");

    session.resetToDefaults();
    REQUIRE(session.params().feed == 0.06, "reset to defaults");
    REQUIRE(rdscan::SimulationSession::isResolutionOption(768) && !rdscan::SimulationSession::isResolutionOption(48),
            "resolution options");
    std::cout << "[PASS] 9A live session contract\n";
}

int main() {
    // =======================
    // Numerics
    // =======================
    runParamValidation_1A();
    runZeroReactionStepIsNoOp_1B();
    runStepRejectsBadInput_1B();
    runStepStaysBoundedAndWraps_1B();
    runSeedShape_1B();
    runMetricsIdenticalSnapshots_2A();
    runMetricsKnownValues_2A();
    runMetricsDimensionMismatch_2A();

    // =======================
    // Scoring
    // =======================
    runClassifierScenarios_3A();
    runClassifierPureAndBounded_3A();
    runScorerBounded_3B();
    runModelParsing_3B();
    runShippedModelMatchesDefault_3B();

    // =======================
    // Evaluation + search
    // =======================
    runEvaluatorSingleFinalSample_4A();
    runEvaluatorDeterministicAndProgress_4A();
    runEvaluatorFailedReadsExcluded_4A();
    runSamplersStayInRange_5A();
    runSamplingMixture_5A();
    runAutoTagIdempotentAndRespectsUser_6A();
    runUserLabelSupersedesAndKeepsNote_6A();
    runBookmarkSync_6B();
    runFeedbackJsonExportImport_6C();
    runScanCompletesAndRanks_7A();
    runScanReentryIsNoOp_7A();
    runScanFinishesImmediatelyWhenFull_7A();
    runScanBatchCeiling_7A();
    runScanCancellation_7A();
    runScanIdsUniqueAcrossScans_7A();
    runQueueProjectionsAndActions_7B();

    // =======================
    // Aggregation + session
    // =======================
    runHeatmapCountsAndNormalization_8A();
    runHeatmapBoundaryInclusive_8A();
    runHeatmapBinIndexDegenerateAxes_8A();
    runHeatmapNoData_8A();
    runSessionContract_9A();

    return 0;
}
