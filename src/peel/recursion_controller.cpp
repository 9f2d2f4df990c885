#include "peel/recursion_controller.hpp"

#include "crypto/sha256.hpp"
#include "peel/format_classifier.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace peel {

namespace {

bool IsArchiveName(const fs::path& p) {
    return FormatClassifier::ClassifyByName(p.filename().string()).has_value();
}

} // namespace

std::vector<std::string> RecursionController::Discover(const std::vector<std::string>& roots) {
    std::vector<std::string> found;
    for (const auto& root : roots) {
        std::error_code ec;
        const auto st = fs::symlink_status(root, ec);
        if (ec) continue;
        if (fs::is_regular_file(st)) {
            if (IsArchiveName(root)) found.push_back(root);
            continue;
        }
        if (!fs::is_directory(st)) continue;

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            const auto est = it->symlink_status(ec);
            if (ec) break;
            if (fs::is_regular_file(est) && IsArchiveName(it->path())) {
                found.push_back(it->path().string());
            }
        }
        if (ec) LogWarn("cannot scan %s: %s", root.c_str(), ec.message().c_str());
    }
    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

Result RecursionController::Enter(const std::string& path) {
    if (static_cast<int>(chain_.size()) > max_depth_) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            "not extracting " + path + ": nesting deeper than " +
                                std::to_string(max_depth_) + " levels");
    }

    std::error_code ec;
    const fs::path canonical = fs::weakly_canonical(path, ec);
    Frame frame{.canonical = ec ? path : canonical.string()};

    if (!visited_.insert(frame.canonical).second) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            "not extracting " + path + " again: already processed");
    }

    if (auto r = Sha256HexFile(path, frame.digest); !r.ok) return r;
    const auto ancestor = std::find_if(chain_.begin(), chain_.end(), [&](const Frame& f) {
        return f.digest == frame.digest;
    });
    if (ancestor != chain_.end()) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            "not extracting " + path + ": it is a copy of " + ancestor->canonical);
    }

    chain_.push_back(std::move(frame));
    return Result::Ok();
}

void RecursionController::Leave() {
    if (!chain_.empty()) chain_.pop_back();
}

} // namespace peel
