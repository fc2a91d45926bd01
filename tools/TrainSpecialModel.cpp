#include "FeedbackStore.h"
#include "SpecialModel.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "TrainSpecialModel usage:\n"
              << "  TrainSpecialModel <feedback.json> [--output file] [--epochs n] [--lr v]\n";
}

struct Fit {
    std::vector<double> weights;
    double bias = 0.0;
};

// Batch gradient descent on standardized rows; lr decays x0.9 every 1000 epochs.
Fit fitLogistic(const std::vector<std::vector<double>>& X, const std::vector<int>& y, int epochs, double lr) {
    const std::size_t n = X.size();
    const std::size_t f = X.front().size();
    Fit fit;
    fit.weights.assign(f, 0.0);

    std::vector<double> grad(f, 0.0);
    for (int epoch = 0; epoch < epochs; ++epoch) {
        std::fill(grad.begin(), grad.end(), 0.0);
        double gradB = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            double z = fit.bias;
            for (std::size_t j = 0; j < f; ++j) z += fit.weights[j] * X[i][j];
            const double err = rdscan::logistic(z) - static_cast<double>(y[i]);
            gradB += err;
            for (std::size_t j = 0; j < f; ++j) grad[j] += err * X[i][j];
        }
        const double inv = 1.0 / static_cast<double>(n);
        fit.bias -= lr * gradB * inv;
        for (std::size_t j = 0; j < f; ++j) fit.weights[j] -= lr * grad[j] * inv;
        if (epoch > 0 && epoch % 1000 == 0) lr *= 0.9;
    }
    return fit;
}

} // namespace

int main(int argc, char** argv) {
    std::string input;
    std::string output = "special-model.json";
    int epochs = 6000;
    double lr = 0.08;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
                output = argv[++i];
            } else if (arg == "--epochs" && i + 1 < argc) {
                epochs = std::stoi(argv[++i]);
            } else if (arg == "--lr" && i + 1 < argc) {
                lr = std::stod(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else if (!arg.empty() && arg[0] != '-' && input.empty()) {
                input = arg;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        } catch (const std::exception&) {
            std::cout << "Bad value for " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (input.empty() || epochs < 1 || !(lr > 0.0)) {
        printUsage();
        return 1;
    }

    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    std::string why;
    int skipped = 0;
    if (!store.loadJson(input, &why, &skipped)) {
        std::fprintf(stderr, "TrainSpecialModel: cannot read %s: %s\n", input.c_str(), why.c_str());
        return 1;
    }
    if (skipped > 0) {
        std::fprintf(stderr, "TrainSpecialModel: skipped %d malformed record(s)\n", skipped);
    }

    rdscan::SpecialModel model;
    model.features = rdscan::defaultSpecialModel().features;
    const std::size_t f = model.features.size();

    std::vector<std::vector<double>> X;
    std::vector<int> y;
    int specials = 0;
    for (const auto& r : store.list()) {
        std::vector<double> row(f, 0.0);
        for (std::size_t j = 0; j < f; ++j) {
            row[j] = rdscan::featureValue(model.features[j], r.metrics, r.params);
        }
        X.push_back(std::move(row));
        const int label = (r.label == rdscan::FeedbackLabel::Special) ? 1 : 0;
        specials += label;
        y.push_back(label);
    }
    if (X.empty()) {
        std::fprintf(stderr, "TrainSpecialModel: no labelled records to train on\n");
        return 1;
    }

    // Sample std; a constant column keeps std 1 so it standardizes to zero.
    const std::size_t n = X.size();
    model.means.assign(f, 0.0);
    model.stds.assign(f, 1.0);
    for (std::size_t j = 0; j < f; ++j) {
        double mean = 0.0;
        for (std::size_t i = 0; i < n; ++i) mean += X[i][j];
        mean /= static_cast<double>(n);
        double var = 0.0;
        for (std::size_t i = 0; i < n; ++i) var += (X[i][j] - mean) * (X[i][j] - mean);
        var /= static_cast<double>(n > 1 ? n - 1 : 1);
        const double sd = var > 0.0 ? std::sqrt(var) : 1.0;
        model.means[j] = mean;
        model.stds[j] = sd;
        for (std::size_t i = 0; i < n; ++i) X[i][j] = (X[i][j] - mean) / sd;
    }

    const Fit fit = fitLogistic(X, y, epochs, lr);
    model.weights = fit.weights;
    model.bias = fit.bias;

    if (!model.valid(&why)) {
        std::fprintf(stderr, "TrainSpecialModel: training diverged: %s\n", why.c_str());
        return 1;
    }
    if (!rdscan::saveSpecialModel(output, model)) {
        std::fprintf(stderr, "TrainSpecialModel: cannot write %s\n", output.c_str());
        return 1;
    }
    std::cout << "Trained on " << n << " record(s) (" << specials << " special) over " << epochs << " epochs\n"
              << "Model saved to " << output << "\n";
    return 0;
}
