#pragma once

#include "peel/archive_spec.hpp"
#include "peel/format_classifier.hpp"
#include "peel/interaction_controller.hpp"
#include "peel/output_placement.hpp"
#include "peel/permission_normalizer.hpp"
#include "peel/pipeline_compiler.hpp"
#include "peel/process_runner.hpp"
#include "peel/recursion_controller.hpp"
#include "peel/tool_registry.hpp"
#include "util/result.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peel {

struct ProcessorOptions {
    Mode mode = Mode::Extract;
    bool recursive = false;
    bool overwrite = false;
    bool flat = false;
    bool interactive = false;
    std::optional<OneEntryPolicy> one_entry;
    std::optional<std::string> password;
    int verbosity = 0;
    int max_recursion_depth = 16;
    std::string downloader = "wget";
    // Where output goes; empty means the current directory.
    std::string output_dir;
};

enum class Outcome {
    Success,
    // The archive was extracted but some nested archives failed.
    PartialFailure,
    Fatal,
};

const char* OutcomeName(Outcome outcome);

struct ExtractionResult {
    std::string input;
    Outcome outcome = Outcome::Success;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string detail; // tool stderr
    std::vector<std::string> failed_entries;
    std::vector<std::string> warnings;
    std::vector<std::string> produced;
    std::vector<std::string> listing;
    // Interrupted mid-extraction; the destination may hold partial output.
    bool indeterminate = false;

    bool Failed() const { return outcome != Outcome::Success; }
};

// Lines reported on stderr for a failed input, each without the "peel: "
// prefix. Tool stderr is shown in full from verbosity 1, else its first line.
std::vector<std::string> FailureSummary(const ExtractionResult& result, int verbosity);

// Drives one input through classification, compilation, execution,
// permission normalization, placement and recursion.
class ArchiveProcessor {
  public:
    ArchiveProcessor(ProcessorOptions opt, ToolAvailability& tools,
                     std::shared_ptr<InteractionController::IPrompter> prompter = nullptr,
                     const std::atomic_bool* cancel = nullptr);

    ExtractionResult Process(const std::string& input);
    // Stops early once an input was interrupted.
    std::vector<ExtractionResult> ProcessAll(const std::vector<std::string>& inputs);

  private:
    Result Extract(const ArchiveSpec& spec, const std::string& parent, InteractionController& ui,
                   ExtractionResult& result, std::vector<std::string>& produced,
                   std::vector<std::string>& nested);
    Result List(const ArchiveSpec& spec, ExtractionResult& result);
    // Extracts `archives`, which must come from an extraction of our own.
    void RecurseInto(const std::vector<std::string>& archives, RecursionController& recursion,
                     ExtractionResult& result);
    RunOptions MakeRunOptions(bool interactive) const;
    bool Cancelled() const { return cancel_ && cancel_->load(); }

    ProcessorOptions opt_;
    std::string output_dir_;
    const std::atomic_bool* cancel_;

    ToolRegistry registry_;
    FormatClassifier classifier_;
    PipelineCompiler compiler_;
    ProcessRunner runner_;
    OutputPlacement placement_;
    PermissionNormalizer normalizer_;
    InteractionController ui_;
    InteractionController nested_ui_;
};

} // namespace peel
