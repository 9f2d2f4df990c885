#include "peel/pipeline_compiler.hpp"

#include "peel/format_classifier.hpp"
#include "peel/output_placement.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <utility>

namespace peel {

namespace {

std::string Substitute(std::string arg, std::string_view token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = arg.find(token, pos)) != std::string::npos) {
        arg.replace(pos, token.size(), value);
        pos += value.size();
    }
    return arg;
}

std::vector<std::string> OptionalArgs(const ToolSpec& tool, CommandKind kind,
                                      const CompileOptions& opt) {
    std::vector<std::string> out;
    if (kind == CommandKind::Extract) {
        const auto& extra = opt.verbosity >= 1 ? tool.verbose_args : tool.quiet_args;
        out.insert(out.end(), extra.begin(), extra.end());
    }
    if (opt.password) {
        out.insert(out.end(), tool.password_args.begin(), tool.password_args.end());
    } else if (!opt.interactive) {
        out.insert(out.end(), tool.no_password_args.begin(), tool.no_password_args.end());
    }
    return out;
}

const char* Verb(Layer layer, CommandKind kind) {
    if (kind == CommandKind::List) return "listing";
    if (IsCompressionFilter(layer)) return "decompressing";
    if (layer == Layer::Rpm || layer == Layer::Deb || layer == Layer::Gem) return "unpacking";
    return "extracting";
}

} // namespace

Result PipelineCompiler::CheckMode(const ArchiveSpec& spec) const {
    if (spec.layers.empty()) {
        return Result::Fail(ErrorKind::UnrecognizedFormat, "no format layers for " + spec.path);
    }
    if (spec.mode != Mode::Metadata) return Result::Ok();

    const Layer outer = spec.layers.front();
    const auto& variants = ToolRegistry::Variants(outer);
    const bool supported = std::any_of(variants.begin(), variants.end(),
                                       [](const ToolSpec& v) { return v.supports_metadata; });
    if (!supported) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            "metadata extraction is not supported for " +
                                DescribeLayers(spec.layers) + " archives");
    }
    if (outer == Layer::Deb && spec.control_member.empty()) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            "no control archive found in " + spec.display_name);
    }
    return Result::Ok();
}

Result PipelineCompiler::Compile(const ArchiveSpec& spec, const CompileOptions& opt,
                                 Pipeline& out) {
    out = Pipeline{};
    out.mode = spec.mode;

    if (auto r = CheckMode(spec); !r.ok) return r;

    std::vector<Layer> layers = spec.layers;
    std::string member;
    const Layer outer = layers.front();

    if (spec.mode == Mode::Metadata) {
        if (outer == Layer::Deb) {
            layers = {Layer::Deb};
            const auto inner = FormatClassifier::ClassifyByName(spec.control_member);
            if (inner) layers.insert(layers.end(), inner->begin(), inner->end());
            member = spec.control_member;
        } else {
            layers = {Layer::Gem, Layer::Gzip};
            member = "metadata.gz";
        }
    } else if (outer == Layer::Deb) {
        member = spec.data_member;
    } else if (outer == Layer::Gem) {
        member = "data.tar.gz";
    }

    // A lone filter (plain compressed file or gem metadata) writes one named file.
    if (IsCompressionFilter(layers.back())) {
        out.single_output = OutputPlacement::BaseName(spec);
    }

    for (std::size_t i = 0; i < layers.size(); ++i) {
        const bool terminal = i + 1 == layers.size();
        auto r = AppendStage(layers[i], i == 0, terminal, spec.mode, member, opt, spec, out);
        if (!r.ok) {
            out.stages.clear();
            return r;
        }
    }

    LogDebug("compiled %s (%s, %s): %zu stage(s)", spec.display_name.c_str(),
             DescribeLayers(layers).c_str(), ModeName(spec.mode), out.stages.size());
    return Result::Ok();
}

Result PipelineCompiler::AppendStage(Layer layer, bool first, bool terminal, Mode mode,
                                     const std::string& member, const CompileOptions& opt,
                                     const ArchiveSpec& spec, Pipeline& out) {
    const bool filter_output = terminal && IsCompressionFilter(layer);
    const CommandKind kind =
        (terminal && mode == Mode::List && !filter_output) ? CommandKind::List : CommandKind::Extract;

    const ToolSpec* tool = nullptr;
    if (auto r = registry_.Select(layer, kind, tool); !r.ok) return r;

    const ToolCommand& cmd = kind == CommandKind::List ? *tool->list : tool->extract;
    PipelineStage stage;
    stage.layer = layer;
    stage.program = cmd.program;
    if (auto r = registry_.ResolveProgram(cmd.program, stage.program_path); !r.ok) return r;
    stage.ok_exit_codes = tool->ok_exit_codes;
    stage.description = std::string(Verb(layer, kind)) + " " + LayerName(layer) + " with " +
                        cmd.program;

    std::string archive_arg = spec.path;
    if (first) {
        stage.stdin_source = tool->Streams() ? StdinSource::ArchiveFile : StdinSource::None;
    } else if (tool->Streams()) {
        stage.stdin_source = StdinSource::PreviousStage;
    } else {
        PipelineStage mat;
        mat.role = StageRole::Materialize;
        mat.layer = layer;
        mat.program = "(materialize)";
        mat.stdin_source = StdinSource::PreviousStage;
        mat.output_name = std::string("payload.") + LayerName(layer);
        mat.description = std::string("buffering ") + LayerName(layer) + " payload";
        out.stages.push_back(std::move(mat));
        stage.stdin_source = StdinSource::None;
        archive_arg = kMaterializedToken;
    }

    for (const auto& arg : cmd.args) {
        if (arg == kOptionsToken) {
            for (auto& extra : OptionalArgs(*tool, kind, opt)) {
                stage.args.push_back(
                    Substitute(std::move(extra), kPasswordToken, opt.password.value_or("")));
            }
            continue;
        }
        std::string a = Substitute(arg, kArchiveToken, archive_arg);
        a = Substitute(std::move(a), kMemberToken, member);
        stage.args.push_back(std::move(a));
    }

    if (!terminal) {
        stage.stdout_sink = StdoutSink::NextStage;
    } else if (filter_output) {
        if (mode == Mode::List) {
            stage.stdout_sink = StdoutSink::Discard;
        } else {
            stage.stdout_sink = StdoutSink::DestinationFile;
            stage.output_name = out.single_output;
        }
    } else {
        stage.stdout_sink = StdoutSink::Capture;
        if (kind == CommandKind::List) out.listing = tool->listing;
    }

    out.stages.push_back(std::move(stage));
    return Result::Ok();
}

} // namespace peel
