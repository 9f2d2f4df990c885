#pragma once

#include "peel/archive_spec.hpp"
#include "peel/pipeline.hpp"
#include "peel/tool_registry.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace peel {

struct CompileOptions {
    std::optional<std::string> password;
    bool interactive = false;
    int verbosity = 0;
};

// Turns an ArchiveSpec into an ordered process pipeline. Unsupported modes
// and missing tools are reported here, before anything is spawned.
class PipelineCompiler {
  public:
    explicit PipelineCompiler(ToolRegistry& registry) : registry_(registry) {}

    Result Compile(const ArchiveSpec& spec, const CompileOptions& opt, Pipeline& out);

  private:
    Result CheckMode(const ArchiveSpec& spec) const;
    Result AppendStage(Layer layer, bool first, bool terminal, Mode mode, const std::string& member,
                       const CompileOptions& opt, const ArchiveSpec& spec, Pipeline& out);

    ToolRegistry& registry_;
};

} // namespace peel
