#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace takeout {

// Maps raw archive entry names to paths relative to the extraction root and
// rejects names that would land outside of it.
class EntryPathPolicy {
  public:
    explicit EntryPathPolicy(bool reject_unsafe) : reject_unsafe_(reject_unsafe) {}

    // An empty result means the entry is the extraction root itself.
    Result Normalize(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlink(const char* raw_path, std::string& out_relative) const;

    static bool IsContained(std::string_view relative);

  private:
    bool reject_unsafe_ = true;
};

} // namespace takeout
