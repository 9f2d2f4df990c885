#include "peel/permission_normalizer.hpp"

#include "util/logger.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace peel {

bool PermissionNormalizer::Fix(const std::string& path, std::vector<std::string>& warnings) const {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        warnings.push_back("cannot stat " + path + ": " + std::strerror(errno));
        return false;
    }
    if (S_ISLNK(st.st_mode)) return false;

    mode_t want = st.st_mode & 07777;
    if (S_ISDIR(st.st_mode)) {
        want |= S_IRWXU;
    } else if (S_ISREG(st.st_mode)) {
        want |= S_IRUSR;
        if (st.st_uid == ::geteuid()) want |= S_IWUSR;
    } else {
        return false;
    }
    if (want != (st.st_mode & 07777) && ::chmod(path.c_str(), want) != 0) {
        warnings.push_back("cannot fix permissions of " + path + ": " + std::strerror(errno));
        return false;
    }
    return S_ISDIR(st.st_mode);
}

std::vector<std::string> PermissionNormalizer::Normalize(const std::string& root) const {
    std::vector<std::string> warnings;
    std::error_code ec;
    fs::recursive_directory_iterator it;
    if (Fix(root, warnings)) {
        it = fs::recursive_directory_iterator(root, fs::directory_options::none, ec);
        if (ec) warnings.push_back("cannot read " + root + ": " + ec.message());
    }

    // Parents are fixed before the iterator descends into them.
    for (const fs::recursive_directory_iterator end; it != end;) {
        const std::string path = it->path().string();
        const bool is_dir = Fix(path, warnings);
        if (!is_dir) it.disable_recursion_pending();
        it.increment(ec);
        if (ec) {
            warnings.push_back("cannot read below " + path + ": " + ec.message());
            break;
        }
    }

    for (const auto& w : warnings) LogWarn("%s", w.c_str());
    return warnings;
}

} // namespace peel
