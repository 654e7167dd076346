#include "merge/progress_sinks.hpp"

#include <cstdio>

namespace takeout {

namespace {
bool g_progress_line_active = false;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return -1;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string stage(e.stage);
    if (stage != last_stage_) {
        last_stage_ = stage;
        last_stage_pct_ = -1;
        last_overall_pct_ = -1;
        stage_finished_ = false;
    }
    if (stage_finished_) return;

    const int stage_pct = Percent(e.stage_done, e.stage_total);
    const int overall_pct = Percent(e.overall_done, e.overall_total);
    if (stage_pct == last_stage_pct_ && overall_pct == last_overall_pct_) return;
    last_stage_pct_ = stage_pct;
    last_overall_pct_ = overall_pct;

    if (stage_pct < 0) {
        std::fprintf(stdout, "\r[%s] %llu bytes", stage.c_str(), (unsigned long long)e.stage_done);
    } else if (overall_pct >= 0) {
        std::fprintf(stdout, "\r[%s] %3d%% | total %3d%%", stage.c_str(), stage_pct, overall_pct);
    } else {
        std::fprintf(stdout, "\r[%s] %3d%%", stage.c_str(), stage_pct);
    }
    std::fflush(stdout);
    g_progress_line_active = true;

    if (stage_pct >= 100) {
        std::fprintf(stdout, "\n");
        std::fflush(stdout);
        stage_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stdout, "\n");
        g_progress_line_active = false;
    }
}

} // namespace takeout
