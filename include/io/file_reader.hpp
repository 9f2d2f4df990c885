#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace peel {

// Read-only handle on a regular file. Sequential reads through IReader,
// positioned reads through ReadAt for header probes.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Fills as much of `out` as the file holds from `offset`; returns bytes read or -1.
    ssize_t ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace peel
