#pragma once

#include "peel/archive_spec.hpp"
#include "peel/tool_registry.hpp"

#include <string>
#include <vector>

namespace peel {

enum class StageRole {
    Process,
    // Writes the previous stage's output to a private file so that a
    // path-only tool can read it. Never spawns anything.
    Materialize,
};

enum class StdinSource {
    None,
    PreviousStage,
    ArchiveFile,
};

enum class StdoutSink {
    Discard,
    NextStage,
    DestinationFile,
    Capture,
};

struct PipelineStage {
    StageRole role = StageRole::Process;
    Layer layer = Layer::Tar;
    std::string program;      // bare name, for messages
    std::string program_path; // resolved absolute path
    std::vector<std::string> args;
    StdinSource stdin_source = StdinSource::None;
    StdoutSink stdout_sink = StdoutSink::Discard;
    // DestinationFile: name inside the working directory.
    // Materialize: name inside the scratch directory.
    std::string output_name;
    std::vector<int> ok_exit_codes{0};
    std::string description;

    std::string CommandLine() const;
    bool AcceptsExit(int code) const;
};

struct Pipeline {
    Mode mode = Mode::Extract;
    std::vector<PipelineStage> stages;
    ListingFormat listing = ListingFormat::Plain;
    // Plain compressed file: the single name it decompresses to.
    std::string single_output;

    bool NeedsMaterialization() const;
    std::size_t ProcessCount() const;
};

} // namespace peel
