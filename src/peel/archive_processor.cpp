#include "peel/archive_processor.hpp"

#include "peel/downloader.hpp"
#include "peel/listing_parser.hpp"
#include "system/scoped_temp_dir.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace peel {

namespace {

void Fail(ExtractionResult& result, const Result& r) {
    result.outcome = Outcome::Fatal;
    result.kind = r.kind;
    result.message = r.msg;
    result.detail = r.detail;
    if (r.kind == ErrorKind::Interrupted) result.indeterminate = true;
}

std::string ResolveOutputDir(const std::string& dir) {
    std::error_code ec;
    const fs::path p = dir.empty() ? fs::current_path(ec) : fs::absolute(dir, ec);
    return ec ? (dir.empty() ? std::string(".") : dir) : p.string();
}

} // namespace

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success:        return "success";
        case Outcome::PartialFailure: return "partial failure";
        case Outcome::Fatal:          return "failed";
    }
    return "failed";
}

std::vector<std::string> FailureSummary(const ExtractionResult& result, int verbosity) {
    std::vector<std::string> lines;
    if (!result.Failed()) return lines;

    const std::string& input = result.input;
    const std::string kind = ErrorKindName(result.kind);
    const bool named = result.message.rfind(kind, 0) == 0;
    lines.push_back(input + ": " + (named ? result.message : kind + ": " + result.message));
    for (const auto& entry : result.failed_entries) lines.push_back(input + ": " + entry);
    if (result.indeterminate) lines.push_back(input + ": output may be incomplete");
    if (result.detail.empty()) return lines;

    if (verbosity >= 1) {
        lines.push_back(input + ": tool output:");
        std::size_t start = 0;
        while (start < result.detail.size()) {
            const auto nl = result.detail.find('\n', start);
            const auto len = nl == std::string::npos ? std::string::npos : nl - start;
            lines.push_back("  " + result.detail.substr(start, len));
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
    } else {
        const auto nl = result.detail.find('\n');
        lines.push_back(input + ": " + result.detail.substr(0, nl) +
                        (nl == std::string::npos ? "" : " (-v for more)"));
    }
    return lines;
}

ArchiveProcessor::ArchiveProcessor(ProcessorOptions opt, ToolAvailability& tools,
                                   std::shared_ptr<InteractionController::IPrompter> prompter,
                                   const std::atomic_bool* cancel)
    : opt_(std::move(opt)),
      output_dir_(ResolveOutputDir(opt_.output_dir)),
      cancel_(cancel),
      registry_(tools),
      compiler_(registry_),
      placement_(PlacementOptions{.overwrite = opt_.overwrite, .flat = opt_.flat}),
      ui_(opt_.interactive, opt_.one_entry, prompter),
      nested_ui_(ui_.Quiet()) {}

RunOptions ArchiveProcessor::MakeRunOptions(bool interactive) const {
    RunOptions ro;
    ro.verbosity = opt_.verbosity;
    ro.interactive = interactive;
    ro.cancel = cancel_;
    return ro;
}

std::vector<ExtractionResult> ArchiveProcessor::ProcessAll(const std::vector<std::string>& inputs) {
    std::vector<ExtractionResult> results;
    for (const auto& input : inputs) {
        results.push_back(Process(input));
        if (results.back().kind == ErrorKind::Interrupted) break;
    }
    return results;
}

ExtractionResult ArchiveProcessor::Process(const std::string& input) {
    ExtractionResult result;
    result.input = input;

    if (Cancelled()) {
        Fail(result, Result::Fail(ErrorKind::Interrupted, "interrupted"));
        result.indeterminate = false;
        return result;
    }

    std::string path;
    if (IsUrl(input)) {
        Downloader downloader(registry_, opt_.downloader);
        if (auto r = downloader.Fetch(input, output_dir_, MakeRunOptions(opt_.interactive), path);
            !r.ok) {
            Fail(result, r);
            return result;
        }
    } else {
        std::error_code ec;
        const fs::path abs = fs::absolute(input, ec);
        path = ec ? input : abs.string();
    }

    ArchiveSpec spec;
    if (auto r = classifier_.Classify(path, opt_.mode, spec); !r.ok) {
        Fail(result, r);
        return result;
    }
    spec.display_name = input;

    if (opt_.mode == Mode::List) {
        if (auto r = List(spec, result); !r.ok) Fail(result, r);
        return result;
    }

    RecursionController recursion(opt_.max_recursion_depth);
    bool entered = false;
    if (opt_.recursive) {
        if (auto r = recursion.Enter(spec.path); r.ok) {
            entered = true;
        } else {
            LogWarn("%s: %s", input.c_str(), r.msg.c_str());
        }
    }

    std::vector<std::string> produced;
    std::vector<std::string> nested;
    if (auto r = Extract(spec, output_dir_, ui_, result, produced, nested); !r.ok) {
        Fail(result, r);
        result.produced = std::move(produced);
        return result;
    }
    result.produced = produced;

    if (opt_.mode == Mode::Extract) {
        if (opt_.recursive) {
            RecurseInto(nested, recursion, result);
        } else {
            if (!nested.empty()) {
                LogWarn("%s contains %zu other archive file(s); use -r to extract them too",
                        input.c_str(), nested.size());
            }
        }
    }
    if (entered) recursion.Leave();

    if (Cancelled()) {
        Fail(result, Result::Fail(ErrorKind::Interrupted, "interrupted during recursive extraction"));
        return result;
    }
    if (result.outcome == Outcome::Success && !result.failed_entries.empty()) {
        result.outcome = Outcome::PartialFailure;
        result.kind = ErrorKind::ExtractionTool;
        result.message = std::to_string(result.failed_entries.size()) +
                         " nested archive(s) could not be extracted";
    }
    return result;
}

Result ArchiveProcessor::Extract(const ArchiveSpec& spec, const std::string& parent,
                                 InteractionController& ui, ExtractionResult& result,
                                 std::vector<std::string>& produced,
                                 std::vector<std::string>& nested) {
    const CompileOptions co{.password = opt_.password,
                            .interactive = ui.Interactive(),
                            .verbosity = opt_.verbosity};
    Pipeline pipeline;
    if (auto r = compiler_.Compile(spec, co, pipeline); !r.ok) return r;

    Destination dest;
    ScopedTempDir staging;
    if (auto r = placement_.Prepare(spec, parent, dest, staging); !r.ok) return r;

    RunOptions ro = MakeRunOptions(ui.Interactive());
    ro.working_dir = staging.Path();
    ro.archive_path = spec.path;
    ro.scratch_base = parent;
    ro.relay_output = opt_.verbosity >= 1;

    RunReport report;
    Result run = runner_.Run(pipeline, ro, report);
    if (!run.ok) {
        if (run.kind == ErrorKind::Interrupted) {
            result.indeterminate = true;
            const bool empty = staging.Empty();
            const std::string left = staging.Release();
            if (!empty) {
                run.msg += "; partial output left in " + left;
            } else {
                std::error_code ec;
                fs::remove(left, ec);
            }
            return run;
        }
        for (auto& w : normalizer_.Normalize(staging.Path())) result.warnings.push_back(std::move(w));
        if (auto p = placement_.PlacePartial(dest, staging); !p.ok) {
            LogWarn("%s: %s", spec.display_name.c_str(), p.msg.c_str());
        } else if (!dest.produced.empty()) {
            run.msg += "; partial output left in " + dest.produced.front();
            produced = dest.produced;
        }
        return run;
    }

    if (const std::string err = report.CombinedStderr(); !err.empty()) {
        LogWarn("%s: tool output:\n%s", spec.display_name.c_str(), err.c_str());
    }

    for (auto& w : normalizer_.Normalize(staging.Path())) result.warnings.push_back(std::move(w));

    // Only archives this run extracted; placement may merge into directories
    // that already hold the user's own files.
    const auto staged_nested = RecursionController::Discover({staging.Path()});

    if (auto r = placement_.Place(spec, dest, staging, ui); !r.ok) return r;
    produced = dest.produced;
    for (const auto& staged : staged_nested) {
        if (std::string placed = OutputPlacement::Relocate(dest, staged); !placed.empty()) {
            nested.push_back(std::move(placed));
        }
    }
    for (const auto& p : produced) {
        LogInfo("%s: extracted to %s", spec.display_name.c_str(), p.c_str());
    }
    return Result::Ok();
}

Result ArchiveProcessor::List(const ArchiveSpec& spec, ExtractionResult& result) {
    const CompileOptions co{.password = opt_.password,
                            .interactive = opt_.interactive,
                            .verbosity = opt_.verbosity};
    Pipeline pipeline;
    if (auto r = compiler_.Compile(spec, co, pipeline); !r.ok) return r;

    // Tools run in a throwaway directory so that listing writes nothing nearby.
    ScopedTempDir scratch;
    if (auto r = ScopedTempDir::Create("", ".peel-list-", scratch); !r.ok) return r;

    RunOptions ro = MakeRunOptions(opt_.interactive);
    ro.working_dir = scratch.Path();
    ro.archive_path = spec.path;
    ro.scratch_base = scratch.Path();

    RunReport report;
    if (auto r = runner_.Run(pipeline, ro, report); !r.ok) return r;

    if (!pipeline.single_output.empty()) {
        result.listing = {pipeline.single_output};
    } else {
        result.listing = ParseListing(pipeline.listing, report.captured);
    }
    return Result::Ok();
}

void ArchiveProcessor::RecurseInto(const std::vector<std::string>& archives,
                                   RecursionController& recursion, ExtractionResult& result) {
    for (const auto& nested : archives) {
        if (Cancelled()) return;

        if (auto r = recursion.Enter(nested); !r.ok) {
            LogWarn("%s", r.msg.c_str());
            result.warnings.push_back(r.msg);
            continue;
        }

        ArchiveSpec spec;
        Result r = classifier_.Classify(nested, Mode::Extract, spec);
        std::vector<std::string> produced;
        std::vector<std::string> inner;
        if (r.ok) {
            spec.depth = static_cast<int>(recursion.Depth()) - 1;
            r = Extract(spec, fs::path(nested).parent_path().string(), nested_ui_, result, produced,
                        inner);
        }

        if (r.ok) {
            std::error_code ec;
            fs::remove(nested, ec);
            if (ec) LogWarn("cannot remove %s: %s", nested.c_str(), ec.message().c_str());
            RecurseInto(inner, recursion, result);
        } else {
            LogError("%s: %s", nested.c_str(), r.msg.c_str());
            result.failed_entries.push_back(nested + ": " + r.msg);
            if (r.kind == ErrorKind::Interrupted) {
                result.indeterminate = true;
                recursion.Leave();
                return;
            }
        }
        recursion.Leave();
    }
}

} // namespace peel
