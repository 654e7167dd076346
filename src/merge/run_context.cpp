#include "merge/run_context.hpp"

namespace takeout {

void RunContext::ApplyDefaults() {
    if (working_dir.empty()) working_dir = ".";
    if (work_root.empty()) work_root = working_dir;
    if (output_dir.empty()) output_dir = working_dir;
}

} // namespace takeout
