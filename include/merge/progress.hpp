#pragma once
#include <cstdint>
#include <string_view>

namespace takeout {

struct ProgressEvent {
    std::string_view stage;
    std::uint64_t stage_done = 0;
    std::uint64_t stage_total = 0;  // 0 => unknown

    std::uint64_t overall_done = 0;
    std::uint64_t overall_total = 0;  // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace takeout
