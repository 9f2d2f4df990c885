#include "system/scoped_temp_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace peel {

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : dir_(std::move(other.dir_)) {
    other.dir_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this == &other)
        return *this;
    Remove();
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    return *this;
}

ScopedTempDir::~ScopedTempDir() { Remove(); }

Result ScopedTempDir::Create(std::string_view base_dir, std::string_view prefix, ScopedTempDir& out) {
    out.Remove();

    fs::path base;
    if (!base_dir.empty()) {
        base = fs::path(base_dir);
    } else {
        const char* tmp = std::getenv("TMPDIR");
        base = (tmp && *tmp) ? fs::path(tmp) : fs::path("/tmp");
    }

    std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(err, "cannot create temporary directory in " + base.string() + ": " +
                                     std::strerror(err));
    }
    out.dir_ = created;
    return Result::Ok();
}

bool ScopedTempDir::Empty() const {
    if (dir_.empty()) return true;
    std::error_code ec;
    return fs::is_empty(dir_, ec) || ec;
}

std::string ScopedTempDir::Release() {
    std::string out = std::move(dir_);
    dir_.clear();
    return out;
}

void ScopedTempDir::Remove() {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        LogWarn("cannot remove %s: %s", dir_.c_str(), ec.message().c_str());
    }
    dir_.clear();
}

} // namespace peel
