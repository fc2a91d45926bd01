// main_vis.cpp: interactive reaction-diffusion explorer
// - Live session grid drawn as a texture, parameter sliders, speed/resolution
// - Auto-scan queue driven one candidate per frame (replay / adopt / discard / label)
// - In-memory bookmark list feeding the codex-* feedback records
// - Special heatmaps (ImPlot) and a feedback export button

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <optional>
#include <random>

#include "AutoScan.h"
#include "FeedbackStore.h"
#include "Heatmap.h"
#include "Sampling.h"
#include "SimulationSession.h"
#include "SpecialModel.h"
#include "Vitality.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define RDSCAN_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

static float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

static std::int64_t now_ms() {
    return rdscan::epochMillis(std::chrono::system_clock::now());
}

// ============================================================
// Grid texture
// ============================================================

struct GridTexture {
    GLuint id = 0;
    int size = 0;
    std::vector<unsigned char> rgba;
};

// Tone map: threshold/contrast/gamma/invert on V, then a two-colour ramp.
static void tone_map(const rdscan::Snapshot& s, const rdscan::SimulationParams& p, std::vector<unsigned char>& out) {
    const std::size_t n = s.cellCount();
    out.resize(n * 4);
    const float thr = (float)p.threshold;
    const float con = (float)p.contrast;
    const float gam = (float)std::max(p.gamma, 0.05);
    for (std::size_t i = 0; i < n; ++i) {
        float x = clampf((s.v[i] - thr) * con + 0.5f, 0.0f, 1.0f);
        x = std::pow(x, gam);
        if (p.invert) x = 1.0f - x;
        out[i * 4 + 0] = (unsigned char)(255.0f * (0.05f + 0.90f * x));
        out[i * 4 + 1] = (unsigned char)(255.0f * (0.08f + 0.75f * x * x));
        out[i * 4 + 2] = (unsigned char)(255.0f * (0.20f + 0.55f * (1.0f - x)));
        out[i * 4 + 3] = 255;
    }
}

static void upload_grid(GridTexture& tex, const rdscan::Snapshot& s, const rdscan::SimulationParams& p) {
    if (s.width <= 0) return;
    if (tex.id == 0) {
        glGenTextures(1, &tex.id);
    }
    tone_map(s, p, tex.rgba);
    glBindTexture(GL_TEXTURE_2D, tex.id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    if (tex.size != s.width) {
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, s.width, s.height, 0, GL_RGBA, GL_UNSIGNED_BYTE, tex.rgba.data());
        tex.size = s.width;
    } else {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, s.width, s.height, GL_RGBA, GL_UNSIGNED_BYTE, tex.rgba.data());
    }
    glBindTexture(GL_TEXTURE_2D, 0);
}

// ============================================================
// UI helpers
// ============================================================

struct VisualUIState {
    bool show_controls = true;
    bool show_scan = true;
    bool show_codex = true;
    bool show_heatmaps = true;
    bool show_metrics = true;
    bool undecided_only = false;
    char note_buf[256] = {0};
    std::string status;
};

static bool param_slider(const char* label, double& value, rdscan::ParamKey key) {
    const rdscan::ParamRange r = rdscan::validRange(key);
    float v = (float)value;
    if (ImGui::SliderFloat(label, &v, (float)r.min, (float)r.max, "%.4f")) {
        value = v;
        return true;
    }
    return false;
}

// ImPlot draws row 0 at the top; our rows start at the lowest Y bin.
static void plot_heatmap(const char* title, const std::optional<rdscan::Heatmap>& h,
                         const rdscan::HeatmapAxis& ax, const rdscan::HeatmapAxis& ay) {
    ImGui::TextUnformatted(title);
    if (!h) {
        ImGui::TextDisabled("  no data");
        return;
    }
    std::vector<double> values((std::size_t)(h->width * h->height));
    for (int y = 0; y < h->height; ++y) {
        for (int x = 0; x < h->width; ++x) {
            values[(std::size_t)((h->height - 1 - y) * h->width + x)] = h->at(x, y).normalized;
        }
    }
    if (ImPlot::BeginPlot(title, ImVec2(-1, 260), ImPlotFlags_NoLegend | ImPlotFlags_NoMouseText)) {
        ImPlot::SetupAxes(h->labelX.c_str(), h->labelY.c_str());
        ImPlot::SetupAxesLimits(ax.min, ax.max, ay.min, ay.max, ImGuiCond_Always);
        ImPlot::PlotHeatmap("##cells", values.data(), h->height, h->width, 0.0, 1.0, nullptr,
                            ImPlotPoint(ax.min, ay.min), ImPlotPoint(ax.max, ay.max));
        ImPlot::EndPlot();
    }
    ImGui::Text("records: %d  max/cell: %d", h->total, h->maxCount);
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1440, 900, "rdscan explorer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef RDSCAN_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- CLI flags ---
    std::string model_path;
    std::string feedback_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--model" && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg == "--feedback" && i + 1 < argc) {
            feedback_path = argv[++i];
        }
    }

    rdscan::SpecialModel model = rdscan::defaultSpecialModel();
    if (!model_path.empty()) {
        std::string why;
        if (!rdscan::loadSpecialModel(model_path, model, &why)) {
            std::fprintf(stderr, "model %s rejected (%s); using built-in coefficients\n", model_path.c_str(), why.c_str());
            model = rdscan::defaultSpecialModel();
        }
    }

    rdscan::FeedbackStore store = rdscan::FeedbackStore::withCuratedSeeds();
    if (!feedback_path.empty()) {
        std::string why;
        if (!store.loadJson(feedback_path, &why)) {
            std::fprintf(stderr, "feedback %s not loaded: %s\n", feedback_path.c_str(), why.c_str());
        }
    }

    rdscan::SimulationSession session;
    rdscan::AutoScanner scanner(store, rdscan::SpecialScorer(model));
    std::vector<rdscan::BookmarkEntry> codex;

    VisualUIState ui;
    GridTexture grid_tex;

    scanner.setBookmarkSink([&](const rdscan::BookmarkEntry& e) {
        codex.insert(codex.begin(), e);
        store.syncBookmarks(codex);
    });
    scanner.setReplaySink([&](const rdscan::SimulationParams& p) {
        std::string why;
        if (!session.applyParameters(p, &why)) {
            ui.status = "replay rejected: " + why;
            return;
        }
        session.setRunning(true);
        session.resetState();
    });

    // Live metric history
    std::vector<double> m_t, m_activity, m_entropy, m_std;
    std::optional<rdscan::MetricsVector> last_metrics;
    constexpr std::size_t kMaxHistory = 4000;
    int frame = 0;

    const rdscan::GoldilocksBand& band = rdscan::goldilocksBand();
    const rdscan::HeatmapAxis feed_axis{rdscan::ParamKey::Feed, "Feed", band.feed.band.min, band.feed.band.max, 6};
    const rdscan::HeatmapAxis kill_axis{rdscan::ParamKey::Kill, "Kill", band.kill.band.min, band.kill.band.max, 6};
    const rdscan::HeatmapAxis contrast_axis{rdscan::ParamKey::Contrast, "Contrast", band.contrast.band.min,
                                            band.contrast.band.max, 6};
    const rdscan::HeatmapAxis gamma_axis{rdscan::ParamKey::Gamma, "Gamma", band.gamma.band.min,
                                         band.gamma.band.max, 6};

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance live grid + one scan candidate (cooperative) ---
        session.advanceFrame();
        if (scanner.scanning()) {
            scanner.step();
        }

        if (ui.show_metrics && session.running() && (frame % 15) == 0) {
            const rdscan::MetricsVector m = session.collectMetrics();
            last_metrics = m;
            m_t.push_back((double)session.iterations());
            m_activity.push_back(m.activity);
            m_entropy.push_back(m.entropy);
            m_std.push_back(0.5 * (m.stdU + m.stdV));
            if (m_t.size() > kMaxHistory) {
                const std::ptrdiff_t drop = (std::ptrdiff_t)(kMaxHistory / 4);
                m_t.erase(m_t.begin(), m_t.begin() + drop);
                m_activity.erase(m_activity.begin(), m_activity.begin() + drop);
                m_entropy.erase(m_entropy.begin(), m_entropy.begin() + drop);
                m_std.erase(m_std.begin(), m_std.begin() + drop);
            }
        }
        ++frame;

        upload_grid(grid_tex, session.currentSnapshot(), session.params());

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef RDSCAN_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        // ---------------- Canvas ----------------
        ImGui::Begin("Canvas");
        {
            const ImVec2 avail = ImGui::GetContentRegionAvail();
            const float side = std::max(64.0f, std::min(avail.x, avail.y - 30.0f));
            if (grid_tex.id != 0) {
                ImGui::Image((ImTextureID)(intptr_t)grid_tex.id, ImVec2(side, side));
            }
            ImGui::Text("%dx%d  iter %llu  %s", session.resolution(), session.resolution(),
                        (unsigned long long)session.iterations(), session.running() ? "running" : "paused");
        }
        ImGui::End();

        // ---------------- Controls ----------------
        if (ui.show_controls) {
            ImGui::Begin("Rule Controls", &ui.show_controls);
            rdscan::SimulationParams p = session.params();
            bool changed = false;
            changed |= param_slider("du", p.du, rdscan::ParamKey::Du);
            changed |= param_slider("dv", p.dv, rdscan::ParamKey::Dv);
            changed |= param_slider("feed", p.feed, rdscan::ParamKey::Feed);
            changed |= param_slider("kill", p.kill, rdscan::ParamKey::Kill);
            changed |= param_slider("dt", p.dt, rdscan::ParamKey::Dt);
            ImGui::Separator();
            changed |= param_slider("threshold", p.threshold, rdscan::ParamKey::Threshold);
            changed |= param_slider("contrast", p.contrast, rdscan::ParamKey::Contrast);
            changed |= param_slider("gamma", p.gamma, rdscan::ParamKey::Gamma);
            changed |= ImGui::Checkbox("invert", &p.invert);
            if (changed) {
                std::string why;
                if (!session.applyParameters(p, &why)) ui.status = why;
            }

            ImGui::Separator();
            if (ImGui::Button(session.running() ? "Pause" : "Run")) session.setRunning(!session.running());
            ImGui::SameLine();
            if (ImGui::Button("Reset state")) session.resetState();
            ImGui::SameLine();
            if (ImGui::Button("Reset DNA")) session.resetToDefaults();
            ImGui::SameLine();
            if (ImGui::Button("Randomize")) {
                static std::mt19937 rng((std::uint32_t)now_ms());
                rdscan::SimulationParams r = rdscan::sampleUniform(rng);
                if (session.applyParameters(r)) session.resetState();
            }

            ImGui::Text("Speed");
            for (int s : rdscan::SimulationSession::kSpeedOptions) {
                ImGui::SameLine();
                char label[16];
                std::snprintf(label, sizeof(label), "%dx", s);
                if (ImGui::RadioButton(label, session.stepsPerFrame() == s)) session.setStepsPerFrame(s);
            }
            ImGui::Text("Resolution");
            for (int r : rdscan::SimulationSession::kResolutionOptions) {
                ImGui::SameLine();
                char label[16];
                std::snprintf(label, sizeof(label), "%d", r);
                if (ImGui::RadioButton(label, session.resolution() == r)) session.setResolution(r);
            }

            ImGui::Separator();
            if (ImGui::Button("Save to codex")) {
                rdscan::BookmarkEntry e;
                e.id = std::to_string(now_ms());
                e.name = "Seed " + std::to_string(codex.size() + 1);
                e.params = session.params();
                e.resolution = session.resolution();
                e.savedAt = rdscan::isoTimestampNow();
                e.metrics = session.collectMetrics();
                codex.insert(codex.begin(), e);
                store.syncBookmarks(codex);
            }
            ImGui::SameLine();
            if (ImGui::Button("Export feedback")) {
                const std::string path = "feedback-export-" + std::to_string(now_ms()) + ".json";
                std::string why;
                ui.status = store.saveJson(path, &why) ? "wrote " + path : "export failed: " + why;
            }
            if (!ui.status.empty()) ImGui::TextWrapped("%s", ui.status.c_str());
            ImGui::End();
        }

        // ---------------- Live metrics ----------------
        if (ui.show_metrics) {
            ImGui::Begin("Live Metrics", &ui.show_metrics);
            if (!m_t.empty() && last_metrics) {
                const rdscan::VitalityAssessment v = rdscan::classify(*last_metrics);
                ImGui::Text("vitality: %s (%.2f)", rdscan::vitalityName(v.category), v.score);
                const int count = (int)m_t.size();
                if (ImPlot::BeginPlot("Activity / Entropy", ImVec2(-1, 220))) {
                    ImPlot::SetupAxes("iteration", nullptr, ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
                    ImPlot::PlotLine("activity", m_t.data(), m_activity.data(), count);
                    ImPlot::PlotLine("entropy", m_t.data(), m_entropy.data(), count);
                    ImPlot::PlotLine("avg std", m_t.data(), m_std.data(), count);
                    ImPlot::EndPlot();
                }
            } else {
                ImGui::TextDisabled("collecting...");
            }
            if (ImGui::Button("Clear history")) {
                m_t.clear(); m_activity.clear(); m_entropy.clear(); m_std.clear();
                last_metrics.reset();
            }
            ImGui::End();
        }

        // ---------------- Auto-scan ----------------
        if (ui.show_scan) {
            ImGui::Begin("Auto Scan", &ui.show_scan);
            if (scanner.scanning()) {
                ImGui::ProgressBar((float)scanner.progress(), ImVec2(-1, 0));
                if (ImGui::Button("Cancel")) scanner.cancel();
            } else if (ImGui::Button("Scan for seeds")) {
                scanner.requestScan();
            }

            rdscan::VisibilityFilter filter = scanner.config().filter;
            bool filter_changed = ImGui::Checkbox("Filter by special likelihood", &filter.enabled);
            float thr = (float)filter.threshold;
            if (ImGui::SliderFloat("min likelihood", &thr, 0.0f, 1.0f, "%.2f")) {
                filter.threshold = thr;
                filter_changed = true;
            }
            if (filter_changed) scanner.setFilter(filter);

            rdscan::AutoTagPolicy tag = scanner.config().autoTag;
            bool tag_changed = ImGui::Checkbox("Auto-tag", &tag.enabled);
            float sp = (float)tag.specialThreshold;
            float nm = (float)tag.normalThreshold;
            if (ImGui::SliderFloat("special >=", &sp, 0.0f, 1.0f, "%.2f")) tag_changed = true;
            if (ImGui::SliderFloat("normal <=", &nm, 0.0f, 1.0f, "%.2f")) tag_changed = true;
            if (tag_changed) {
                tag.specialThreshold = sp;
                tag.normalThreshold = std::min(nm, sp);
                scanner.setAutoTagPolicy(tag);
            }
            ImGui::Checkbox("Undecided only", &ui.undecided_only);

            const std::vector<rdscan::Candidate> rows = ui.undecided_only ? scanner.undecidedQueue() : scanner.visibleQueue();
            ImGui::Text("%d shown / %d queued", (int)rows.size(), (int)scanner.queue().size());

            std::string pending_discard;
            std::string pending_adopt;
            if (ImGui::BeginTable("queue", 6, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY | ImGuiTableFlags_Borders,
                                  ImVec2(0, 360))) {
                ImGui::TableSetupColumn("id");
                ImGui::TableSetupColumn("class");
                ImGui::TableSetupColumn("score");
                ImGui::TableSetupColumn("p(special)");
                ImGui::TableSetupColumn("label");
                ImGui::TableSetupColumn("actions");
                ImGui::TableHeadersRow();
                for (const auto& c : rows) {
                    ImGui::PushID(c.id.c_str());
                    ImGui::TableNextRow();
                    ImGui::TableNextColumn();
                    ImGui::TextUnformatted(c.id.c_str());
                    ImGui::TableNextColumn();
                    ImGui::TextUnformatted(rdscan::vitalityName(c.classification));
                    ImGui::TableNextColumn();
                    ImGui::Text("%.3f", c.score);
                    ImGui::TableNextColumn();
                    ImGui::Text("%.3f", c.specialLikelihood.value_or(0.0));
                    ImGui::TableNextColumn();
                    const rdscan::FeedbackRecord* r = store.find(c.id);
                    if (r) {
                        ImGui::Text("%s (%s)", rdscan::feedbackLabelName(r->label), rdscan::feedbackSourceName(r->source));
                    } else {
                        ImGui::TextDisabled("-");
                    }
                    ImGui::TableNextColumn();
                    if (ImGui::SmallButton("Replay")) scanner.replay(c.id);
                    ImGui::SameLine();
                    if (ImGui::SmallButton("Adopt")) pending_adopt = c.id;
                    ImGui::SameLine();
                    if (ImGui::SmallButton("Discard")) pending_discard = c.id;
                    ImGui::SameLine();
                    if (ImGui::SmallButton("Special")) scanner.label(c.id, rdscan::FeedbackLabel::Special);
                    ImGui::SameLine();
                    if (ImGui::SmallButton("Normal")) scanner.label(c.id, rdscan::FeedbackLabel::Normal);
                    ImGui::PopID();
                }
                ImGui::EndTable();
            }
            // Mutate the queue only after the table no longer iterates it.
            if (!pending_adopt.empty()) {
                const rdscan::Candidate* c = scanner.findCandidate(pending_adopt);
                if (c) {
                    const rdscan::SimulationParams p = c->params;
                    if (scanner.adopt(pending_adopt, session.resolution())) {
                        std::string why;
                        if (session.applyParameters(p, &why)) {
                            session.setRunning(false);
                            session.resetState();
                        } else {
                            ui.status = "adopted params rejected: " + why;
                        }
                    }
                }
            }
            if (!pending_discard.empty()) scanner.discard(pending_discard);
            ImGui::End();
        }

        // ---------------- Codex ----------------
        if (ui.show_codex) {
            ImGui::Begin("Codex", &ui.show_codex);
            std::size_t remove_at = codex.size();
            for (std::size_t i = 0; i < codex.size(); ++i) {
                rdscan::BookmarkEntry& e = codex[i];
                ImGui::PushID(e.id.c_str());
                ImGui::Text("%s  [%d]  feed %.3f kill %.3f", e.name.c_str(), e.resolution, e.params.feed, e.params.kill);
                ImGui::SameLine();
                if (ImGui::SmallButton("Load")) {
                    rdscan::SessionLoadRequest req;
                    req.params = e.params;
                    req.resolution = e.resolution;
                    std::string why;
                    if (!session.loadBookmark(req, &why)) ui.status = "load failed: " + why;
                }
                ImGui::SameLine();
                if (ImGui::SmallButton("Delete")) remove_at = i;
                ImGui::SameLine();
                if (ImGui::SmallButton("Note")) {
                    std::snprintf(ui.note_buf, sizeof(ui.note_buf), "%s", e.note ? e.note->c_str() : "");
                    ImGui::OpenPopup("note");
                }
                if (ImGui::BeginPopup("note")) {
                    ImGui::InputText("##note", ui.note_buf, sizeof(ui.note_buf));
                    if (ImGui::Button("Save")) {
                        const std::string text = ui.note_buf;
                        if (text.empty()) e.note.reset(); else e.note = text;
                        store.syncBookmarks(codex);
                        ImGui::CloseCurrentPopup();
                    }
                    ImGui::EndPopup();
                }
                ImGui::PopID();
            }
            if (remove_at < codex.size()) {
                codex.erase(codex.begin() + (std::ptrdiff_t)remove_at);
                store.syncBookmarks(codex);
            }
            if (codex.empty()) ImGui::TextDisabled("no bookmarks yet");
            ImGui::End();
        }

        // ---------------- Heatmaps ----------------
        if (ui.show_heatmaps) {
            ImGui::Begin("Special Heatmaps", &ui.show_heatmaps);
            plot_heatmap("Manual specials: feed x kill",
                         rdscan::buildHeatmap(store.manualSpecialRecords(), feed_axis, kill_axis), feed_axis, kill_axis);
            plot_heatmap("All specials: contrast x gamma",
                         rdscan::buildHeatmap(store.specialRecords(), contrast_axis, gamma_axis), contrast_axis,
                         gamma_axis);
            ImGui::End();
        }

        // --- render ---
        ImGui::Render();
        int display_w = 0;
        int display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.06f, 0.06f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    if (grid_tex.id != 0) glDeleteTextures(1, &grid_tex.id);

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
