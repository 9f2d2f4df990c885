#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace peel {

// Tracks the chain of archives being recursed into. Refuses revisits,
// archives that are byte-for-byte copies of an ancestor, and chains deeper
// than the configured bound.
class RecursionController {
  public:
    explicit RecursionController(int max_depth) : max_depth_(max_depth) {}

    // Archive files (by name) beneath `roots`. Symlinks are not followed.
    static std::vector<std::string> Discover(const std::vector<std::string>& roots);

    Result Enter(const std::string& path);
    void Leave();

    std::size_t Depth() const { return chain_.size(); }
    int MaxDepth() const { return max_depth_; }

  private:
    struct Frame {
        std::string canonical;
        std::string digest;
    };

    int max_depth_;
    std::vector<Frame> chain_;
    std::set<std::string> visited_;
};

} // namespace peel
