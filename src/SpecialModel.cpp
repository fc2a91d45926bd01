#include "SpecialModel.h"

#include <json/json.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>

namespace rdscan {

namespace {

SpecialModel buildDefaultModel() {
    SpecialModel m;
    m.features = {"activity", "entropy", "stdU", "stdV", "feed", "kill",
                  "threshold", "dt", "contrast", "gamma", "invert"};
    m.weights = {0.0, -3.843121, -3.273239, -2.824382, 0.119074, 2.127106,
                 0.880959, 1.928114, -1.594759, 1.604194, -0.873481};
    m.bias = 1.961439;
    m.means = {0.0, 0.88, 0.198333, 0.133889, 0.038667, 0.047667,
               0.196667, 1.5, 3.938889, 0.422222, 0.111111};
    m.stds = {1.0, 0.787464, 0.103362, 0.10373, 0.042965, 0.020994,
              0.014142, 0.353553, 1.61512, 0.389801, 0.333333};
    return m;
}

bool readNumberArray(const Json::Value& v, const char* key, std::vector<double>& out, std::string* why) {
    const Json::Value& arr = v[key];
    if (!arr.isArray()) {
        if (why) *why = std::string("model field '") + key + "' is not an array";
        return false;
    }
    out.clear();
    out.reserve(arr.size());
    for (Json::ArrayIndex i = 0; i < arr.size(); ++i) {
        if (!arr[i].isNumeric()) {
            if (why) *why = std::string("model field '") + key + "' holds a non-number";
            return false;
        }
        out.push_back(arr[i].asDouble());
    }
    return true;
}

} // namespace

bool SpecialModel::valid(std::string* why) const {
    const std::size_t n = features.size();
    if (n == 0) {
        if (why) *why = "model has no features";
        return false;
    }
    if (weights.size() != n || means.size() != n || stds.size() != n) {
        if (why) *why = "model arrays differ in length from the feature list";
        return false;
    }
    if (!std::isfinite(bias)) {
        if (why) *why = "model bias is not finite";
        return false;
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(weights[i]) || !std::isfinite(means[i]) || !std::isfinite(stds[i])) {
            if (why) *why = "model coefficient for '" + features[i] + "' is not finite";
            return false;
        }
    }
    return true;
}

const SpecialModel& defaultSpecialModel() {
    static const SpecialModel model = buildDefaultModel();
    return model;
}

bool specialModelFromJson(const Json::Value& root, SpecialModel& out, std::string* why) {
    if (!root.isObject()) {
        if (why) *why = "model root is not an object";
        return false;
    }

    SpecialModel m;
    const Json::Value& features = root["features"];
    if (!features.isArray()) {
        if (why) *why = "model field 'features' is not an array";
        return false;
    }
    for (Json::ArrayIndex i = 0; i < features.size(); ++i) {
        if (!features[i].isString()) {
            if (why) *why = "model field 'features' holds a non-string";
            return false;
        }
        m.features.push_back(features[i].asString());
    }

    if (!readNumberArray(root, "weights", m.weights, why)) return false;
    if (!readNumberArray(root, "means", m.means, why)) return false;
    if (!readNumberArray(root, "stds", m.stds, why)) return false;
    if (!root["bias"].isNumeric()) {
        if (why) *why = "model field 'bias' is not a number";
        return false;
    }
    m.bias = root["bias"].asDouble();

    if (!m.valid(why)) return false;
    out = std::move(m);
    return true;
}

bool specialModelFromString(const std::string& text, SpecialModel& out, std::string* why) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        if (why) *why = "model JSON parse error: " + errs;
        return false;
    }
    return specialModelFromJson(root, out, why);
}

bool loadSpecialModel(const std::string& path, SpecialModel& out, std::string* why) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (why) *why = "cannot open model file: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return specialModelFromString(ss.str(), out, why);
}

Json::Value specialModelToJson(const SpecialModel& model) {
    Json::Value root(Json::objectValue);
    Json::Value features(Json::arrayValue);
    Json::Value weights(Json::arrayValue);
    Json::Value means(Json::arrayValue);
    Json::Value stds(Json::arrayValue);
    for (const auto& f : model.features) features.append(f);
    for (double w : model.weights) weights.append(w);
    for (double v : model.means) means.append(v);
    for (double v : model.stds) stds.append(v);
    root["features"] = features;
    root["weights"] = weights;
    root["bias"] = model.bias;
    root["means"] = means;
    root["stds"] = stds;
    return root;
}

bool saveSpecialModel(const std::string& path, const SpecialModel& model) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, specialModelToJson(model)) << '\n';
    return static_cast<bool>(out);
}

double missingFeatureDefault(const std::string& feature) {
    if (feature == "dt" || feature == "contrast" || feature == "gamma") return 1.0;
    return 0.0;
}

double featureValue(const std::string& feature, const MetricsVector& m, const SimulationParams& p) {
    if (feature == "activity") return m.activity;
    if (feature == "entropy")  return m.entropy;
    if (feature == "stdU")     return m.stdU;
    if (feature == "stdV")     return m.stdV;
    if (feature == "meanU")    return m.meanU;
    if (feature == "meanV")    return m.meanV;

    ParamKey key;
    if (parseParamKey(feature, key)) {
        return paramValue(p, key);
    }
    return missingFeatureDefault(feature);
}

double logistic(double z) {
    // Branch on sign so exp() never overflows.
    if (z >= 0.0) {
        const double e = std::exp(-z);
        return 1.0 / (1.0 + e);
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

SpecialScorer::SpecialScorer()
    : model_(defaultSpecialModel()) {}

SpecialScorer::SpecialScorer(SpecialModel model)
    : model_(std::move(model)) {}

double SpecialScorer::score(const MetricsVector& m, const SimulationParams& p) const {
    double sum = model_.bias;
    const std::size_t n = std::min({model_.features.size(), model_.weights.size(),
                                    model_.means.size(), model_.stds.size()});
    for (std::size_t i = 0; i < n; ++i) {
        double value = featureValue(model_.features[i], m, p);
        if (!std::isfinite(value)) {
            value = missingFeatureDefault(model_.features[i]);
        }
        const double z = (value - model_.means[i]) / std::max(model_.stds[i], kStdEpsilon);
        sum += model_.weights[i] * z;
    }
    if (std::isnan(sum)) return 0.0;
    const double prob = logistic(sum);
    return (prob < 0.0) ? 0.0 : (prob > 1.0) ? 1.0 : prob;
}

} // namespace rdscan
