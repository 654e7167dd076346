#pragma once

#include "merge/progress.hpp"

#include <string>

namespace takeout {

// Single status line on stdout, redrawn with '\r' whenever a percentage changes.
class ConsoleProgressSink final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override;

  private:
    std::string last_stage_;
    int last_stage_pct_ = -1;
    int last_overall_pct_ = -1;
    bool stage_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace takeout
