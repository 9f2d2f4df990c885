#pragma once

#include "peel/pipeline.hpp"
#include "util/result.hpp"

#include <atomic>
#include <string>
#include <string_view>
#include <vector>

namespace peel {

struct RunOptions {
    // Child working directory; DestinationFile sinks are created here.
    std::string working_dir;
    std::string archive_path;
    // Parent for the materialization scratch directory. Empty means $TMPDIR.
    std::string scratch_base;
    int verbosity = 0;
    // Non-interactive children run in a new session without a terminal.
    bool interactive = false;
    // Relay captured stdout of extraction runs to our stdout.
    bool relay_output = false;
    const std::atomic_bool* cancel = nullptr;
};

struct StageReport {
    std::string program;
    int exit_code = -1;
    int signal = 0;
    bool ok = false;
    std::string stderr_text;
};

struct RunReport {
    std::vector<StageReport> stages; // parallel to Pipeline::stages
    std::string captured;
    bool interrupted = false;
    int failed_stage = -1;

    std::string CombinedStderr() const;
};

// Spawns a compiled pipeline with pipes between stages, captures stderr per
// stage and decides the outcome from the exit statuses.
class ProcessRunner {
  public:
    Result Run(const Pipeline& pipeline, const RunOptions& opt, RunReport& out) const;

    // Maps a failed tool's stderr onto the error taxonomy.
    static ErrorKind ClassifyFailure(std::string_view stderr_text);

  private:
    Result RunSegment(const Pipeline& pipeline, std::size_t begin, std::size_t end,
                      const std::string& sink_file, const std::string& materialized,
                      const RunOptions& opt, RunReport& out) const;
};

} // namespace peel
