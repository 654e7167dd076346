#pragma once

#include "util/result.hpp"

#include <string>

namespace takeout {

// Per-run scratch area `<root>/.takeout-merge-XXXXXX` holding `extract/`
// (one archive at a time) and `merged/`. Removed on destruction.
class WorkDirectory {
  public:
    static constexpr const char kPrefix[] = ".takeout-merge-";

    static Result Create(const std::string& root, WorkDirectory& out);

    WorkDirectory() = default;
    WorkDirectory(const WorkDirectory&) = delete;
    WorkDirectory& operator=(const WorkDirectory&) = delete;
    WorkDirectory(WorkDirectory&& other) noexcept;
    WorkDirectory& operator=(WorkDirectory&& other) noexcept;
    ~WorkDirectory();

    const std::string& Dir() const { return dir_; }
    std::string ExtractDir() const;
    std::string MergedDir() const;

    // Empty extract/ for the next archive.
    Result PrepareExtractDir() const;
    Result DiscardExtractDir() const;

    Result Remove();

  private:
    void Cleanup();

    std::string dir_;
};

} // namespace takeout
