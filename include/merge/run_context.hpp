#pragma once

#include "merge/archive_discovery.hpp"
#include "util/merger_config.hpp"

#include <chrono>
#include <string>

namespace takeout {

constexpr const char kDefaultOutputLabel[] = "Takeout";
constexpr const char kDefaultWrapperDirectory[] = "Takeout";

// Everything a run reads from its environment, made explicit.
struct RunContext {
    std::string working_dir;  // where archives are searched
    std::string work_root;    // parent of the scratch directory
    std::string output_dir;   // where the artifact lands

    std::string output_label = kDefaultOutputLabel;
    DiscoveryOptions discovery;
    std::string wrapper_directory = kDefaultWrapperDirectory;
    DateFallback date_fallback = DateFallback::CurrentDate;
    MergeMode merge_mode = MergeMode::Move;

    int compression_level = 9;
    unsigned compression_threads = 0;
    bool write_checksum = true;

    // Used only when no date is found in the first archive's name.
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();

    // Fills empty directories from working_dir.
    void ApplyDefaults();
};

} // namespace takeout
