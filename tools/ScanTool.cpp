#include "AutoScan.h"
#include "FeedbackStore.h"
#include "Heatmap.h"
#include "SpecialModel.h"
#include "Vitality.h"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void printUsage() {
    std::cout << "ScanTool usage:\n"
              << "  ScanTool [--target n] [--batch-size n] [--max-batches n]\n"
              << "           [--resolution n] [--iterations n] [--interval n] [--seed n]\n"
              << "           [--model file] [--feedback-in file] [--feedback-out file]\n"
              << "           [--filter t] [--no-autotag] [--special t] [--normal t] [--heatmap]\n";
}

bool parseInt(const char* text, int& out) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(text, &used);
        if (text[used] != '\0') return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const char* text, double& out) {
    try {
        std::size_t used = 0;
        const double v = std::stod(text, &used);
        if (text[used] != '\0') return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void printHeatmap(const char* title, const std::optional<rdscan::Heatmap>& h) {
    std::cout << "\n" << title << "\n";
    if (!h) {
        std::cout << "  (no data)\n";
        return;
    }
    // Top row is the highest Y bin.
    for (int y = h->height - 1; y >= 0; --y) {
        std::cout << std::setw(8) << h->ticksY[static_cast<std::size_t>(y)] << " |";
        for (int x = 0; x < h->width; ++x) {
            std::cout << std::setw(4) << h->at(x, y).count;
        }
        std::cout << "\n";
    }
    std::cout << "         +";
    for (int x = 0; x < h->width; ++x) std::cout << "----";
    std::cout << "\n          ";
    for (int x = 0; x < h->width; ++x) {
        std::cout << " " << h->ticksX[static_cast<std::size_t>(x)].substr(0, 3);
    }
    std::cout << "\n  x: " << h->labelX << "  y: " << h->labelY << "  records: " << h->total << "\n";
}

} // namespace

int main(int argc, char** argv) {
    rdscan::AutoScanConfig config;
    std::string modelPath;
    std::string feedbackIn;
    std::string feedbackOut;
    bool heatmap = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        bool ok = true;
        if (arg == "--target" && hasValue) {
            ok = parseInt(argv[++i], config.targetQueueSize);
        } else if (arg == "--batch-size" && hasValue) {
            ok = parseInt(argv[++i], config.batchSize);
        } else if (arg == "--max-batches" && hasValue) {
            ok = parseInt(argv[++i], config.maxBatches);
        } else if (arg == "--resolution" && hasValue) {
            ok = parseInt(argv[++i], config.evaluation.resolution);
        } else if (arg == "--iterations" && hasValue) {
            ok = parseInt(argv[++i], config.evaluation.totalIterations);
        } else if (arg == "--interval" && hasValue) {
            ok = parseInt(argv[++i], config.evaluation.sampleInterval);
        } else if (arg == "--seed" && hasValue) {
            int seed = 0;
            ok = parseInt(argv[++i], seed);
            config.rngSeed = static_cast<std::uint32_t>(seed);
        } else if (arg == "--model" && hasValue) {
            modelPath = argv[++i];
        } else if (arg == "--feedback-in" && hasValue) {
            feedbackIn = argv[++i];
        } else if (arg == "--feedback-out" && hasValue) {
            feedbackOut = argv[++i];
        } else if (arg == "--filter" && hasValue) {
            config.filter.enabled = true;
            ok = parseDouble(argv[++i], config.filter.threshold);
        } else if (arg == "--no-autotag") {
            config.autoTag.enabled = false;
        } else if (arg == "--special" && hasValue) {
            ok = parseDouble(argv[++i], config.autoTag.specialThreshold);
        } else if (arg == "--normal" && hasValue) {
            ok = parseDouble(argv[++i], config.autoTag.normalThreshold);
        } else if (arg == "--heatmap") {
            heatmap = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
        if (!ok) {
            std::cout << "Bad value for " << arg << ": " << argv[i] << "\n";
            printUsage();
            return 1;
        }
    }

    if (config.evaluation.resolution <= 0 || config.evaluation.totalIterations <= 0 ||
        config.evaluation.sampleInterval <= 0 || config.batchSize <= 0) {
        std::cout << "resolution, iterations, interval and batch size must be positive\n";
        return 1;
    }

    rdscan::SpecialModel model = rdscan::defaultSpecialModel();
    if (!modelPath.empty()) {
        std::string why;
        if (!rdscan::loadSpecialModel(modelPath, model, &why)) {
            std::fprintf(stderr, "ScanTool: cannot load model %s: %s\n", modelPath.c_str(), why.c_str());
            return 1;
        }
    }

    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    if (!feedbackIn.empty()) {
        std::string why;
        int skipped = 0;
        if (!store.loadJson(feedbackIn, &why, &skipped)) {
            std::fprintf(stderr, "ScanTool: cannot read feedback %s: %s\n", feedbackIn.c_str(), why.c_str());
            return 1;
        }
        if (skipped > 0) {
            std::fprintf(stderr, "ScanTool: skipped %d malformed feedback record(s)\n", skipped);
        }
    }

    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(model), config);
    scanner.requestScan();
    if (scanner.scanning()) {
        std::cout << "Scanning up to " << scanner.plannedBatches() << " batch(es) of " << config.batchSize
                  << " at " << config.evaluation.resolution << "x" << config.evaluation.resolution << "\n";
    }

    int lastPercent = -1;
    scanner.run([&lastPercent](double fraction) {
        const int percent = static_cast<int>(fraction * 100.0);
        if (percent / 10 != lastPercent / 10) {
            std::fprintf(stderr, "  progress %3d%%\n", percent);
            lastPercent = percent;
        }
    });

    const std::vector<rdscan::Candidate> visible = scanner.visibleQueue();
    std::cout << "\nRanked queue (" << visible.size() << " visible of " << scanner.queue().size()
              << ", batches " << scanner.batchesRun() << ")\n";
    std::cout << std::left << std::setw(22) << "id" << std::setw(12) << "class" << std::right << std::setw(8)
              << "score" << std::setw(8) << "vital" << std::setw(8) << "p(sp)" << std::setw(8) << "feed"
              << std::setw(8) << "kill" << std::setw(8) << "du" << std::setw(8) << "dv" << "  label\n";
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& c : visible) {
        const rdscan::FeedbackRecord* r = store.find(c.id);
        std::cout << std::left << std::setw(22) << c.id << std::setw(12) << rdscan::vitalityName(c.classification)
                  << std::right << std::setw(8) << c.score << std::setw(8) << c.vitalityScore.value_or(0.0)
                  << std::setw(8) << c.specialLikelihood.value_or(0.0) << std::setw(8) << c.params.feed
                  << std::setw(8) << c.params.kill << std::setw(8) << c.params.du << std::setw(8) << c.params.dv
                  << "  " << (r ? rdscan::feedbackLabelName(r->label) : "-") << "\n";
    }

    if (heatmap) {
        const rdscan::GoldilocksBand& band = rdscan::goldilocksBand();
        rdscan::HeatmapAxis feed{rdscan::ParamKey::Feed, "Feed", band.feed.band.min, band.feed.band.max, 6};
        rdscan::HeatmapAxis kill{rdscan::ParamKey::Kill, "Kill", band.kill.band.min, band.kill.band.max, 6};
        rdscan::HeatmapAxis contrast{rdscan::ParamKey::Contrast, "Contrast", band.contrast.band.min,
                                     band.contrast.band.max, 6};
        rdscan::HeatmapAxis gamma{rdscan::ParamKey::Gamma, "Gamma", band.gamma.band.min, band.gamma.band.max, 6};
        printHeatmap("Manual specials: feed x kill", rdscan::buildHeatmap(store.manualSpecialRecords(), feed, kill));
        printHeatmap("All specials: contrast x gamma", rdscan::buildHeatmap(store.specialRecords(), contrast, gamma));
    }

    if (!feedbackOut.empty()) {
        std::string why;
        if (!store.saveJson(feedbackOut, &why)) {
            std::fprintf(stderr, "ScanTool: cannot write feedback %s: %s\n", feedbackOut.c_str(), why.c_str());
            return 1;
        }
        std::cout << "\nWrote " << store.size() << " feedback record(s) to: " << feedbackOut << "\n";
    }
    return 0;
}
