#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace peel {

// Owns a mkdtemp(3) directory and removes it, with its contents, on
// destruction unless Release() was called.
class ScopedTempDir {
  public:
    ScopedTempDir() = default;
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;
    ~ScopedTempDir();

    // An empty base_dir means $TMPDIR, falling back to /tmp.
    static Result Create(std::string_view base_dir, std::string_view prefix, ScopedTempDir& out);

    const std::string& Path() const { return dir_; }
    bool Valid() const { return !dir_.empty(); }
    bool Empty() const;

    // Stops owning the directory and returns its path.
    std::string Release();
    // Removes the directory now. Safe to call twice.
    void Remove();

  private:
    std::string dir_;
};

} // namespace peel
