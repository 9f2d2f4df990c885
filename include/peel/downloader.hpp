#pragma once

#include "peel/process_runner.hpp"
#include "peel/tool_registry.hpp"
#include "util/result.hpp"

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace peel {

// Fetches a URL argument into the output directory with wget or curl.
class Downloader {
  public:
    Downloader(ToolRegistry& registry, std::string tool) : registry_(registry), tool_(std::move(tool)) {}

    // Saves to `dest_dir`/<last URL path segment>. Refuses to replace an
    // existing file of that name.
    Result Fetch(const std::string& url, const std::string& dest_dir, const RunOptions& base,
                 std::string& out_path);

    // The command line used for `url`, without the resolved program path.
    static std::vector<std::string> Arguments(const std::string& tool, const std::string& url,
                                              const std::string& filename);

  private:
    ToolRegistry& registry_;
    std::string tool_;
};

} // namespace peel
