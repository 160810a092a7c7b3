#pragma once

#include "util/progress.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace wdi {

// Single "\r"-refreshed stderr line per download.
class ConsoleProgressSink final : public IProgress {
  public:
    explicit ConsoleProgressSink(std::uint64_t min_step_bytes = 256 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

  private:
    std::mutex mu_;
    std::string last_component_;
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
    bool finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace wdi
