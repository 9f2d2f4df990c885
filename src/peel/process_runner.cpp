#include "peel/process_runner.hpp"

#include "io/fd.hpp"
#include "system/scoped_temp_dir.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <utility>

namespace peel {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
// Time between SIGTERM and SIGKILL after an interrupt.
constexpr auto kKillGrace = std::chrono::seconds(2);

struct Child {
    std::size_t stage = 0;
    pid_t pid = -1;
    int status = 0;
    bool reaped = false;
    // Leads its own session, so the whole group can be signalled.
    bool group = false;
};

bool Cancelled(const RunOptions& opt) { return opt.cancel && opt.cancel->load(); }

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("pipe failed: ") + std::strerror(err));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

Result OpenFd(const std::string& path, int flags, Fd& out) {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "cannot open " + path + ": " + std::strerror(err));
    }
    out.Reset(fd);
    return Result::Ok();
}

std::string Substitute(std::string arg, std::string_view token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = arg.find(token, pos)) != std::string::npos) {
        arg.replace(pos, token.size(), value);
        pos += value.size();
    }
    return arg;
}

// Everything between fork and exec sticks to async-signal-safe calls.
pid_t Spawn(const PipelineStage& stage, const std::vector<std::string>& args, int in, int out,
            int err, const RunOptions& opt) {
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(stage.program);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    const std::string exec_error = "peel: cannot execute " + stage.program_path + "\n";
    const std::string chdir_error = "peel: cannot enter " + opt.working_dir + "\n";

    const pid_t pid = ::fork();
    if (pid != 0) return pid;

    if (!opt.interactive) ::setsid();
    ::dup2(err, STDERR_FILENO);
    if (!opt.working_dir.empty() && ::chdir(opt.working_dir.c_str()) != 0) {
        (void)!::write(STDERR_FILENO, chdir_error.data(), chdir_error.size());
        ::_exit(126);
    }
    ::dup2(in, STDIN_FILENO);
    ::dup2(out, STDOUT_FILENO);
    ::execv(stage.program_path.c_str(), argv.data());
    (void)!::write(STDERR_FILENO, exec_error.data(), exec_error.size());
    ::_exit(127);
}

void Signal(const Child& c, int sig) {
    // The group may not exist yet if the child has not reached setsid().
    if (c.group && ::kill(-c.pid, sig) == 0) return;
    ::kill(c.pid, sig);
}

void TerminateAll(std::vector<Child>& children, int sig) {
    for (const auto& c : children) {
        if (c.pid > 0 && !c.reaped) Signal(c, sig);
    }
}

void KillAfterGrace(Child& c) {
    const auto deadline = std::chrono::steady_clock::now() + kKillGrace;
    while (!c.reaped && std::chrono::steady_clock::now() < deadline) {
        const pid_t r = ::waitpid(c.pid, &c.status, WNOHANG);
        if (r == c.pid) c.reaped = true;
        else ::usleep(100 * 1000);
    }
    if (!c.reaped) Signal(c, SIGKILL);
}

void Reap(std::vector<Child>& children, const RunOptions& opt, bool& interrupted) {
    for (auto& c : children) {
        if (c.pid <= 0 || c.reaped) continue;
        if (interrupted) KillAfterGrace(c);
        while (!c.reaped) {
            const pid_t r = ::waitpid(c.pid, &c.status, 0);
            if (r == c.pid) {
                c.reaped = true;
            } else if (r < 0 && errno == EINTR) {
                if (Cancelled(opt) && !interrupted) {
                    interrupted = true;
                    TerminateAll(children, SIGTERM);
                    KillAfterGrace(c);
                }
            } else {
                LogWarn("waitpid(%d) failed: %s", static_cast<int>(c.pid), std::strerror(errno));
                c.reaped = true;
                c.status = 0xff00;
            }
        }
    }
}

bool MentionsPassword(std::string_view chunk) {
    return ToLower(std::string(chunk)).find("password") != std::string::npos;
}

std::string Trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // namespace

std::string RunReport::CombinedStderr() const {
    std::string out;
    for (const auto& s : stages) {
        if (s.stderr_text.empty()) continue;
        if (!out.empty() && out.back() != '\n') out += '\n';
        out += s.stderr_text;
    }
    return out;
}

ErrorKind ProcessRunner::ClassifyFailure(std::string_view stderr_text) {
    const std::string text = ToLower(std::string(stderr_text));
    static const char* const kPasswordMarkers[] = {
        "password", "encrypted", "unable to get password",
    };
    static const char* const kCompressionMarkers[] = {
        "unsupported compression method", "compression method not supported",
        "unsupported method", "unknown compression method",
    };
    for (const char* m : kPasswordMarkers) {
        if (text.find(m) != std::string::npos) return ErrorKind::PasswordProtected;
    }
    for (const char* m : kCompressionMarkers) {
        if (text.find(m) != std::string::npos) return ErrorKind::UnsupportedCompression;
    }
    return ErrorKind::ExtractionTool;
}

Result ProcessRunner::Run(const Pipeline& pipeline, const RunOptions& opt, RunReport& out) const {
    out = RunReport{};
    out.stages.resize(pipeline.stages.size());
    for (std::size_t i = 0; i < pipeline.stages.size(); ++i) {
        out.stages[i].program = pipeline.stages[i].program;
    }

    ScopedTempDir scratch;
    if (pipeline.NeedsMaterialization()) {
        if (auto r = ScopedTempDir::Create(opt.scratch_base, ".peel-buffer-", scratch); !r.ok) return r;
    }

    std::string materialized;
    std::size_t begin = 0;
    const std::size_t n = pipeline.stages.size();
    while (begin < n) {
        std::size_t end = begin;
        while (end < n && pipeline.stages[end].role != StageRole::Materialize) ++end;

        std::string sink_file;
        if (end < n) sink_file = scratch.Path() + "/" + pipeline.stages[end].output_name;

        if (auto r = RunSegment(pipeline, begin, end, sink_file, materialized, opt, out); !r.ok) {
            return r;
        }
        if (end == n) break;

        out.stages[end].ok = true;
        out.stages[end].exit_code = 0;
        materialized = sink_file;
        begin = end + 1;
    }
    return Result::Ok();
}

Result ProcessRunner::RunSegment(const Pipeline& pipeline, std::size_t begin, std::size_t end,
                                 const std::string& sink_file, const std::string& materialized,
                                 const RunOptions& opt, RunReport& out) const {
    std::vector<Child> children;
    std::vector<Fd> err_fds;
    Fd capture;
    Fd prev_read;
    bool interrupted = false;

    auto abort_spawn = [&](Result r) {
        TerminateAll(children, SIGTERM);
        bool killed = true;
        Reap(children, opt, killed);
        return r;
    };

    for (std::size_t k = begin; k < end; ++k) {
        const PipelineStage& stage = pipeline.stages[k];

        Fd in;
        switch (stage.stdin_source) {
            case StdinSource::PreviousStage:
                in = std::move(prev_read);
                break;
            case StdinSource::ArchiveFile:
                if (auto r = OpenFd(opt.archive_path, O_RDONLY, in); !r.ok) return abort_spawn(r);
                break;
            case StdinSource::None:
                if (auto r = OpenFd("/dev/null", O_RDONLY, in); !r.ok) return abort_spawn(r);
                break;
        }
        if (!in.Valid()) {
            return abort_spawn(Result::Fail(EINVAL, "stage " + stage.program + " has no input"));
        }

        Fd stage_out;
        Fd next_read;
        if (k + 1 < end) {
            if (auto r = MakePipe(next_read, stage_out); !r.ok) return abort_spawn(r);
        } else if (!sink_file.empty()) {
            if (auto r = OpenFd(sink_file, O_WRONLY | O_CREAT | O_EXCL, stage_out); !r.ok) {
                return abort_spawn(r);
            }
        } else {
            switch (stage.stdout_sink) {
                case StdoutSink::DestinationFile: {
                    const std::string path = opt.working_dir + "/" + stage.output_name;
                    if (auto r = OpenFd(path, O_WRONLY | O_CREAT | O_EXCL, stage_out); !r.ok) {
                        return abort_spawn(r);
                    }
                    break;
                }
                case StdoutSink::Capture:
                    if (auto r = MakePipe(capture, stage_out); !r.ok) return abort_spawn(r);
                    break;
                case StdoutSink::Discard:
                case StdoutSink::NextStage:
                    if (auto r = OpenFd("/dev/null", O_WRONLY, stage_out); !r.ok) {
                        return abort_spawn(r);
                    }
                    break;
            }
        }

        Fd err_read;
        Fd err_write;
        if (auto r = MakePipe(err_read, err_write); !r.ok) return abort_spawn(r);

        std::vector<std::string> args;
        args.reserve(stage.args.size());
        for (const auto& a : stage.args) args.push_back(Substitute(a, kMaterializedToken, materialized));

        LogDebug("running: %s", stage.CommandLine().c_str());
        const pid_t pid = Spawn(stage, args, in.Get(), stage_out.Get(), err_write.Get(), opt);
        if (pid < 0) {
            const int err = errno;
            return abort_spawn(Result::Fail(err, "cannot start " + stage.program + ": " +
                                                     std::strerror(err)));
        }
        children.push_back(Child{.stage = k, .pid = pid, .group = !opt.interactive});
        err_fds.push_back(std::move(err_read));
        prev_read = std::move(next_read);
    }
    prev_read.Close();

    // Drain stderr of every stage plus the captured stdout.
    std::vector<pollfd> pfds;
    std::vector<std::size_t> owners; // stage index, or `end` for the capture pipe
    for (std::size_t i = 0; i < err_fds.size(); ++i) {
        pfds.push_back(pollfd{err_fds[i].Get(), POLLIN, 0});
        owners.push_back(children[i].stage);
    }
    if (capture.Valid()) {
        pfds.push_back(pollfd{capture.Get(), POLLIN, 0});
        owners.push_back(end);
    }

    std::vector<char> buf(kReadChunk);
    std::size_t open_fds = pfds.size();
    using Clock = std::chrono::steady_clock;
    Clock::time_point kill_at;
    Clock::time_point give_up_at;
    bool killed = false;
    while (open_fds > 0) {
        if (!interrupted && Cancelled(opt)) {
            interrupted = true;
            TerminateAll(children, SIGTERM);
            kill_at = Clock::now() + kKillGrace;
        }
        if (interrupted && !killed && Clock::now() >= kill_at) {
            TerminateAll(children, SIGKILL);
            killed = true;
            give_up_at = Clock::now() + kKillGrace;
        }
        // Something outside the process groups still holds a pipe open.
        if (killed && Clock::now() >= give_up_at) {
            LogWarn("abandoning output of interrupted tools");
            break;
        }
        const int ready = ::poll(pfds.data(), pfds.size(), 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LogWarn("poll failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        for (std::size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            const ssize_t n = ::read(pfds[i].fd, buf.data(), buf.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            if (n <= 0) {
                pfds[i].fd = -1;
                --open_fds;
                continue;
            }
            const std::string_view chunk(buf.data(), static_cast<std::size_t>(n));
            if (owners[i] == end) {
                out.captured.append(chunk);
                if (opt.relay_output) {
                    std::fwrite(chunk.data(), 1, chunk.size(), stdout);
                    std::fflush(stdout);
                }
            } else {
                out.stages[owners[i]].stderr_text.append(chunk);
                if (opt.interactive && MentionsPassword(chunk)) {
                    std::fwrite(chunk.data(), 1, chunk.size(), stderr);
                    std::fflush(stderr);
                }
            }
        }
    }
    err_fds.clear();
    capture.Close();

    Reap(children, opt, interrupted);
    if (Cancelled(opt)) interrupted = true;

    int blamed = -1;
    for (const auto& c : children) {
        StageReport& rep = out.stages[c.stage];
        const PipelineStage& stage = pipeline.stages[c.stage];
        if (WIFEXITED(c.status)) {
            rep.exit_code = WEXITSTATUS(c.status);
            rep.ok = stage.AcceptsExit(rep.exit_code);
        } else if (WIFSIGNALED(c.status)) {
            rep.signal = WTERMSIG(c.status);
            rep.ok = false;
        }
        if (rep.ok) continue;
        if (blamed < 0) {
            blamed = static_cast<int>(c.stage);
        } else if (out.stages[blamed].signal == SIGPIPE && rep.signal != SIGPIPE) {
            blamed = static_cast<int>(c.stage);
        }
    }

    if (interrupted) {
        out.interrupted = true;
        return Result::Fail(ErrorKind::Interrupted, "interrupted");
    }
    if (blamed < 0) return Result::Ok();

    out.failed_stage = blamed;
    const StageReport& rep = out.stages[blamed];
    const PipelineStage& stage = pipeline.stages[blamed];
    std::string msg = stage.description + " failed: '" + stage.CommandLine() + "' ";
    if (rep.signal != 0) {
        msg += "was killed by signal " + std::to_string(rep.signal);
    } else {
        msg += "returned status code " + std::to_string(rep.exit_code);
    }
    const std::string detail = Trimmed(rep.stderr_text);
    return Result::Fail(ClassifyFailure(detail), std::move(msg), detail);
}

} // namespace peel
