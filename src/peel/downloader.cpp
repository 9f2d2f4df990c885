#include "peel/downloader.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <sys/stat.h>

namespace peel {

std::vector<std::string> Downloader::Arguments(const std::string& tool, const std::string& url,
                                               const std::string& filename) {
    if (tool == "curl") return {"-f", "-s", "-S", "-L", "-o", filename, url};
    return {"-q", "-O", filename, url};
}

Result Downloader::Fetch(const std::string& url, const std::string& dest_dir,
                         const RunOptions& base, std::string& out_path) {
    const std::string filename = UrlBasename(url);
    if (filename.empty() || filename == "." || filename == "..") {
        return Result::Fail(ErrorKind::Usage, "cannot pick a file name for " + url);
    }
    out_path = dest_dir + "/" + filename;

    struct stat st {};
    if (::lstat(out_path.c_str(), &st) == 0) {
        return Result::Fail(ErrorKind::Usage,
                            "not downloading " + url + ": " + out_path + " already exists");
    }

    PipelineStage stage;
    stage.program = tool_;
    if (auto r = registry_.ResolveProgram(tool_, stage.program_path); !r.ok) return r;
    stage.args = Arguments(tool_, url, filename);
    stage.stdin_source = StdinSource::None;
    stage.stdout_sink = StdoutSink::Discard;
    stage.description = "downloading " + url;

    Pipeline pipeline;
    pipeline.stages.push_back(std::move(stage));

    RunOptions opt = base;
    opt.working_dir = dest_dir;
    opt.archive_path.clear();
    opt.relay_output = false;

    LogInfo("downloading %s to %s", url.c_str(), out_path.c_str());
    RunReport report;
    Result r = ProcessRunner{}.Run(pipeline, opt, report);
    if (!r.ok && r.kind != ErrorKind::Interrupted) {
        r.kind = ErrorKind::Io;
    }
    return r;
}

} // namespace peel
