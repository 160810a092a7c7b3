#include "util/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace wdi {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string cur_component(e.component);
    if (cur_component != last_component_) {
        last_component_ = cur_component;
        finished_ = false;
        next_ = 0;
    }
    if (finished_) return;

    const bool complete = e.total > 0 && e.done >= e.total;
    if (e.done < next_ && !complete) return;
    next_ = e.done + min_step_;

    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% (%llu/%llu bytes)",
                     (int)e.component.size(),
                     e.component.data(),
                     pct,
                     (unsigned long long)e.done,
                     (unsigned long long)e.total);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %llu bytes",
                     (int)e.component.size(),
                     e.component.data(),
                     (unsigned long long)e.done);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (complete) {
        std::fprintf(stderr, "\n");
        finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace wdi
