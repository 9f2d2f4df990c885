#include "peel/output_placement.hpp"

#include "peel/format_classifier.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace peel {

namespace {

std::vector<std::string> Split(std::string_view s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = s.find(sep, start);
        out.emplace_back(s.substr(start, pos == std::string_view::npos ? s.npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

std::string Join(const std::vector<std::string>& parts, std::size_t count, char sep) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

mode_t CurrentUmask() {
    const mode_t mask = ::umask(0);
    ::umask(mask);
    return mask;
}

// mkdtemp creates 0700; a placed directory gets the usual mode.
void RelaxStagingMode(const std::string& path) {
    if (::chmod(path.c_str(), 0777 & ~CurrentUmask()) != 0) {
        LogWarn("cannot set permissions of %s: %s", path.c_str(), std::strerror(errno));
    }
}

int CreateExclusive(const std::string& path, bool directory) {
    if (directory) {
        return ::mkdir(path.c_str(), 0777) == 0 ? 0 : errno;
    }
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) return errno;
    ::close(fd);
    return 0;
}

bool Exists(const std::string& path) {
    struct stat st {};
    return ::lstat(path.c_str(), &st) == 0;
}

bool SameFile(const std::string& a, const std::string& b) {
    std::error_code ec;
    return fs::equivalent(a, b, ec) && !ec;
}

Result Rename(const std::string& src, const std::string& dst) {
    if (::rename(src.c_str(), dst.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(err, "cannot move " + src + " to " + dst + ": " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace

std::string OutputPlacement::StripArchiveSuffix(std::string_view filename) {
    if (const SuffixRule* rule = FormatClassifier::MatchSuffix(filename)) {
        return std::string(filename.substr(0, filename.size() - rule->suffix.size()));
    }
    // Unknown extension: drop it when it is short enough to be one.
    const auto dot = filename.rfind('.');
    if (dot != std::string_view::npos && dot > 0) {
        const std::size_t ext_len = filename.size() - dot - 1;
        if (ext_len > 0 && ext_len < 5) return std::string(filename.substr(0, dot));
    }
    return std::string(filename);
}

std::string OutputPlacement::BaseName(const ArchiveSpec& spec) {
    const std::string filename = fs::path(spec.path).filename().string();
    const Layer outer = spec.layers.empty() ? Layer::Tar : spec.layers.front();

    if (spec.mode == Mode::Metadata && outer == Layer::Gem) {
        return filename + "-metadata.txt";
    }

    std::string base;
    if (outer == Layer::Deb) {
        // name_version_arch.deb -> name_version
        const auto pieces = Split(filename, '_');
        const std::string& last = pieces.back();
        if (pieces.size() > 1 && last.size() <= 10 && EndsWith(ToLower(last), ".deb")) {
            base = Join(pieces, pieces.size() - 1, '_');
        }
    } else if (outer == Layer::Rpm) {
        // name-version-release.arch.rpm -> name-version-release
        auto pieces = Split(StripArchiveSuffix(filename), '.');
        if (pieces.size() > 1 && pieces.back().size() < 8) pieces.pop_back();
        base = Join(pieces, pieces.size(), '.');
    }
    if (base.empty()) base = StripArchiveSuffix(filename);
    return base.empty() ? filename : base;
}

StagedContents OutputPlacement::Inspect(const std::string& staging_dir,
                                        const std::string& base_name) {
    StagedContents out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(staging_dir, ec)) {
        out.entries.push_back(entry.path().filename().string());
    }
    std::sort(out.entries.begin(), out.entries.end());

    if (out.entries.empty()) {
        out.type = ContentType::Empty;
    } else if (out.entries.size() == 1) {
        out.type = out.entries.front() == base_name ? ContentType::Matching : ContentType::OneEntry;
        const auto st = fs::symlink_status(fs::path(staging_dir) / out.entries.front(), ec);
        out.entry_is_directory = !ec && fs::is_directory(st);
    } else {
        out.type = ContentType::Bomb;
    }
    return out;
}

Result OutputPlacement::Prepare(const ArchiveSpec& spec, const std::string& parent,
                                Destination& dest, ScopedTempDir& staging) const {
    dest = Destination{};
    dest.parent = parent;
    dest.base_name = BaseName(spec);
    if (auto r = ScopedTempDir::Create(parent, kStagingPrefix, staging); !r.ok) {
        return r;
    }
    LogDebug("%s: staging in %s, base name %s", spec.display_name.c_str(),
             staging.Path().c_str(), dest.base_name.c_str());
    return Result::Ok();
}

Result OutputPlacement::Place(const ArchiveSpec& spec, Destination& dest, ScopedTempDir& staging,
                              InteractionController& ui) const {
    const StagedContents contents = Inspect(staging.Path(), dest.base_name);

    if (contents.type == ContentType::Empty) {
        LogWarn("%s: archive is empty, nothing extracted", spec.display_name.c_str());
        staging.Remove();
        return Result::Ok();
    }
    if (opt_.flat) return MergeInto(spec, staging, dest);

    Result r = Result::Ok();
    const std::string only = contents.entries.front();
    const std::string source = staging.Path() + "/" + only;
    switch (contents.type) {
        case ContentType::Matching:
            r = PlaceEntry(spec, dest, source, dest.base_name, contents.entry_is_directory, ui);
            break;
        case ContentType::OneEntry: {
            const OneEntryPolicy policy = ui.ResolveSingleEntry(SingleEntryQuestion{
                .archive = spec.display_name,
                .base_name = dest.base_name,
                .entry_name = only,
                .entry_is_directory = contents.entry_is_directory,
            });
            if (policy == OneEntryPolicy::Inside) {
                return PlaceWrapped(spec, dest, staging, ui);
            }
            const std::string& name = policy == OneEntryPolicy::Rename ? dest.base_name : only;
            r = PlaceEntry(spec, dest, source, name, contents.entry_is_directory, ui);
            break;
        }
        case ContentType::Bomb:
        case ContentType::Empty:
            return PlaceWrapped(spec, dest, staging, ui);
    }
    if (r.ok) staging.Remove();
    return r;
}

Result OutputPlacement::PlacePartial(Destination& dest, ScopedTempDir& staging) const {
    if (!staging.Valid() || staging.Empty()) {
        staging.Remove();
        return Result::Ok();
    }
    std::string path;
    if (auto r = ClaimName(dest.parent, dest.base_name, true, path); !r.ok) return r;
    if (auto r = Rename(staging.Path(), path); !r.ok) return r;
    dest.moved.emplace_back(staging.Release(), path);
    RelaxStagingMode(path);
    dest.produced.push_back(path);
    return Result::Ok();
}

Result OutputPlacement::PlaceWrapped(const ArchiveSpec& spec, Destination& dest,
                                     ScopedTempDir& staging, InteractionController& ui) const {
    std::string path;
    bool overwrite = false;
    if (auto r = ClaimOrAsk(spec, dest.parent, dest.base_name, true, ui, path, overwrite); !r.ok) {
        return r;
    }
    if (overwrite) {
        if (auto r = MoveOver(staging.Path(), path); !r.ok) return r;
        dest.moved.emplace_back(staging.Release(), path);
    } else {
        if (auto r = Rename(staging.Path(), path); !r.ok) return r;
        dest.moved.emplace_back(staging.Release(), path);
        RelaxStagingMode(path);
    }
    dest.produced.push_back(path);
    return Result::Ok();
}

Result OutputPlacement::PlaceEntry(const ArchiveSpec& spec, Destination& dest,
                                   const std::string& source, const std::string& name,
                                   bool is_directory, InteractionController& ui) const {
    std::string path;
    bool overwrite = false;
    if (auto r = ClaimOrAsk(spec, dest.parent, name, is_directory, ui, path, overwrite); !r.ok) {
        return r;
    }
    if (auto r = overwrite ? MoveOver(source, path) : Rename(source, path); !r.ok) return r;
    dest.moved.emplace_back(source, path);
    dest.produced.push_back(path);
    return Result::Ok();
}

Result OutputPlacement::MergeInto(const ArchiveSpec& spec, ScopedTempDir& staging,
                                  Destination& dest) const {
    const StagedContents contents = Inspect(staging.Path(), dest.base_name);
    for (const auto& name : contents.entries) {
        const std::string source = staging.Path() + "/" + name;
        std::string target = dest.parent + "/" + name;
        Result r = Result::Ok();
        if (SameFile(target, spec.path)) {
            // Never replace the archive being extracted.
            const auto st = fs::symlink_status(source);
            if (auto c = ClaimName(dest.parent, name, fs::is_directory(st), target); !c.ok) return c;
            r = Rename(source, target);
        } else {
            r = MoveOver(source, target);
        }
        if (!r.ok) return r;
        dest.moved.emplace_back(source, target);
        dest.produced.push_back(target);
    }
    staging.Remove();
    return Result::Ok();
}

Result OutputPlacement::ClaimOrAsk(const ArchiveSpec& spec, const std::string& parent,
                                   const std::string& name, bool directory,
                                   InteractionController& ui, std::string& out_path,
                                   bool& overwrite) const {
    out_path = parent + "/" + name;
    overwrite = false;

    if (opt_.overwrite && !SameFile(out_path, spec.path)) {
        overwrite = Exists(out_path);
        return Result::Ok();
    }

    const int err = CreateExclusive(out_path, directory);
    if (err == 0) return Result::Ok();
    if (err != EEXIST) {
        return Result::Fail(err, "cannot create " + out_path + ": " + std::strerror(err));
    }

    if (ui.Interactive() && !SameFile(out_path, spec.path)) {
        const CollisionChoice choice =
            ui.ResolveCollision(CollisionQuestion{.archive = spec.display_name, .existing = out_path});
        if (choice == CollisionChoice::Overwrite) {
            overwrite = true;
            return Result::Ok();
        }
        if (choice == CollisionChoice::Skip) {
            return Result::Fail(ErrorKind::DestinationCollision,
                                out_path + " already exists; skipped " + spec.display_name);
        }
    }

    if (auto r = ClaimName(parent, name, directory, out_path); !r.ok) return r;
    LogInfo("%s: %s/%s exists, extracting to %s", spec.display_name.c_str(), parent.c_str(),
            name.c_str(), out_path.c_str());
    return Result::Ok();
}

Result OutputPlacement::ClaimName(const std::string& parent, const std::string& name,
                                  bool directory, std::string& out_path) {
    for (int i = 0; i < kMaxRenameAttempts; ++i) {
        const std::string candidate =
            parent + "/" + (i == 0 ? name : name + "-" + std::to_string(i));
        const int err = CreateExclusive(candidate, directory);
        if (err == 0) {
            out_path = candidate;
            return Result::Ok();
        }
        if (err != EEXIST) {
            return Result::Fail(err, "cannot create " + candidate + ": " + std::strerror(err));
        }
    }
    return Result::Fail(ErrorKind::DestinationCollision,
                        "no free name for " + name + " in " + parent + " after " +
                            std::to_string(kMaxRenameAttempts) + " attempts");
}

std::string OutputPlacement::Relocate(const Destination& dest, const std::string& staged_path) {
    for (const auto& [from, to] : dest.moved) {
        if (staged_path == from) return to;
        if (staged_path.size() > from.size() && staged_path.compare(0, from.size(), from) == 0 &&
            staged_path[from.size()] == '/') {
            return to + staged_path.substr(from.size());
        }
    }
    return {};
}

Result OutputPlacement::MoveOver(const std::string& src, const std::string& dst) {
    struct stat dst_st {};
    if (::lstat(dst.c_str(), &dst_st) != 0) {
        if (errno != ENOENT) {
            const int err = errno;
            return Result::Fail(err, "cannot stat " + dst + ": " + std::strerror(err));
        }
        return Rename(src, dst);
    }

    struct stat src_st {};
    if (::lstat(src.c_str(), &src_st) != 0) {
        const int err = errno;
        return Result::Fail(err, "cannot stat " + src + ": " + std::strerror(err));
    }

    if (S_ISDIR(src_st.st_mode) && S_ISDIR(dst_st.st_mode)) {
        std::error_code ec;
        std::vector<std::string> children;
        for (const auto& e : fs::directory_iterator(src, ec)) {
            children.push_back(e.path().filename().string());
        }
        if (ec) return Result::Fail(ec.value(), "cannot read " + src + ": " + ec.message());
        for (const auto& child : children) {
            if (auto r = MoveOver(src + "/" + child, dst + "/" + child); !r.ok) return r;
        }
        if (::rmdir(src.c_str()) != 0) {
            const int err = errno;
            return Result::Fail(err, "cannot remove " + src + ": " + std::strerror(err));
        }
        return Result::Ok();
    }

    std::error_code ec;
    fs::remove_all(dst, ec);
    if (ec) return Result::Fail(ec.value(), "cannot replace " + dst + ": " + ec.message());
    return Rename(src, dst);
}

} // namespace peel
