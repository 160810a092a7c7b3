#pragma once
#include <cstdint>
#include <string_view>

namespace wdi {

struct ProgressEvent {
    std::string_view component;
    std::uint64_t done = 0;
    std::uint64_t total = 0;  // 0 when the size is not known yet
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace wdi
