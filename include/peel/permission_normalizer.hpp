#pragma once

#include <string>
#include <vector>

namespace peel {

// Makes extracted trees usable by their owner: directories u+rwx, files u+r
// (and u+w when owned by the effective user). Symlinks are left alone.
class PermissionNormalizer {
  public:
    // Returns one warning per entry whose mode could not be widened.
    std::vector<std::string> Normalize(const std::string& root) const;

  private:
    bool Fix(const std::string& path, std::vector<std::string>& warnings) const;
};

} // namespace peel
