#pragma once

#include "io/io.hpp"
#include "peel/tool_registry.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/peel_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // chmod first: some tests leave unreadable entries behind.
        if (!path_.empty()) {
            std::string cmd = "chmod -R u+rwx '" + path_ + "' 2>/dev/null; rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string operator/(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

class MemoryReader final : public peel::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct Entry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

enum class Container { Tar, Zip, Cpio };
enum class Compression { None, Gzip, Bzip2, Xz };

// Writes an archive with libarchive. Directories are given as entries with
// file_type AE_IFDIR.
inline void BuildArchive(const std::string& out_path,
                         const std::vector<Entry>& entries,
                         Container container = Container::Tar,
                         Compression compression = Compression::None) {
    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");

    int rc = ARCHIVE_OK;
    switch (container) {
        case Container::Tar:  rc = archive_write_set_format_pax_restricted(a); break;
        case Container::Zip:  rc = archive_write_set_format_zip(a); break;
        case Container::Cpio: rc = archive_write_set_format_cpio_newc(a); break;
    }
    if (rc == ARCHIVE_OK) {
        switch (compression) {
            case Compression::None:  break;
            case Compression::Gzip:  rc = archive_write_add_filter_gzip(a); break;
            case Compression::Bzip2: rc = archive_write_add_filter_bzip2(a); break;
            case Compression::Xz:    rc = archive_write_add_filter_xz(a); break;
        }
    }
    if (rc != ARCHIVE_OK || archive_write_open_filename(a, out_path.c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "setup failed";
        (void)archive_write_free(a);
        throw std::runtime_error("cannot create " + out_path + ": " + err);
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty() &&
            archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_data failed");
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    (void)archive_write_free(a);
}

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good())
        throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::stringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

// Plain gzip stream of `contents`, as gzip(1) would write it.
inline void WriteGzipFile(const std::string& path, const std::string& contents) {
    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz)
        throw std::runtime_error("gzopen failed: " + path);
    if (!contents.empty() &&
        gzwrite(gz, contents.data(), static_cast<unsigned>(contents.size())) == 0) {
        gzclose(gz);
        throw std::runtime_error("gzwrite failed: " + path);
    }
    if (gzclose(gz) != Z_OK)
        throw std::runtime_error("gzclose failed: " + path);
}

inline bool Exists(const std::string& path) {
    struct stat st {};
    return ::lstat(path.c_str(), &st) == 0;
}

inline bool IsDir(const std::string& path) {
    struct stat st {};
    return ::lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

inline bool HaveTools(std::initializer_list<const char*> programs) {
    const auto locator = peel::ToolAvailability::SearchPathLocator();
    return std::all_of(programs.begin(), programs.end(),
                       [&](const char* p) { return locator->Locate(p).has_value(); });
}

// Locator backed by a fixed table, so tests decide which tools exist.
class FakeLocator final : public peel::ToolAvailability::ILocator {
  public:
    explicit FakeLocator(std::map<std::string, std::string> table) : table_(std::move(table)) {}

    std::optional<std::string> Locate(std::string_view program) const override {
        ++lookups_;
        auto it = table_.find(std::string(program));
        if (it == table_.end())
            return std::nullopt;
        return it->second;
    }

    int Lookups() const { return lookups_; }

  private:
    std::map<std::string, std::string> table_;
    mutable int lookups_ = 0;
};

// Every program resolves to /usr/bin/<name>.
class EverythingLocator final : public peel::ToolAvailability::ILocator {
  public:
    std::optional<std::string> Locate(std::string_view program) const override {
        return "/usr/bin/" + std::string(program);
    }
};

// Real $PATH lookups, but the named programs are reported missing.
class HidingLocator final : public peel::ToolAvailability::ILocator {
  public:
    explicit HidingLocator(std::vector<std::string> hidden)
        : hidden_(std::move(hidden)), real_(peel::ToolAvailability::SearchPathLocator()) {}

    std::optional<std::string> Locate(std::string_view program) const override {
        if (std::find(hidden_.begin(), hidden_.end(), program) != hidden_.end())
            return std::nullopt;
        return real_->Locate(program);
    }

  private:
    std::vector<std::string> hidden_;
    std::shared_ptr<const peel::ToolAvailability::ILocator> real_;
};

} // namespace testutil
