#include "peel/pipeline.hpp"

#include <algorithm>

namespace peel {

std::string PipelineStage::CommandLine() const {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

bool PipelineStage::AcceptsExit(int code) const {
    return std::find(ok_exit_codes.begin(), ok_exit_codes.end(), code) != ok_exit_codes.end();
}

bool Pipeline::NeedsMaterialization() const {
    return std::any_of(stages.begin(), stages.end(),
                       [](const PipelineStage& s) { return s.role == StageRole::Materialize; });
}

std::size_t Pipeline::ProcessCount() const {
    return static_cast<std::size_t>(
        std::count_if(stages.begin(), stages.end(),
                      [](const PipelineStage& s) { return s.role == StageRole::Process; }));
}

} // namespace peel
