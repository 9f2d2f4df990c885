#include "peel/format_classifier.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <span>

namespace peel {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

struct MagicRule {
    std::size_t offset;
    std::vector<std::uint8_t> bytes;
    Layer layer;
};

std::vector<std::uint8_t> Bytes(std::string_view s) {
    return {s.begin(), s.end()};
}

// Containers before filters; the weak lzma signature goes last.
const std::vector<MagicRule>& MagicRules() {
    static const std::vector<MagicRule> kRules = {
        {0, Bytes("!<arch>\ndebian-binary"), Layer::Deb},
        {0, {0xED, 0xAB, 0xEE, 0xDB}, Layer::Rpm},
        {0, Bytes("PK\x03\x04"), Layer::Zip},
        {0, Bytes("PK\x05\x06"), Layer::Zip},
        {0, Bytes("PK\x07\x08"), Layer::Zip},
        {0, Bytes("Rar!\x1A\x07"), Layer::Rar},
        {0, {'7', 'z', 0xBC, 0xAF, 0x27, 0x1C}, Layer::SevenZip},
        {0, Bytes("MSCF"), Layer::Cab},
        {0, Bytes("ISc("), Layer::InstallShield},
        {0, {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1}, Layer::Msi},
        {0, {0x60, 0xEA}, Layer::Arj},
        {0, Bytes("070701"), Layer::Cpio},
        {0, Bytes("070702"), Layer::Cpio},
        {0, Bytes("070707"), Layer::Cpio},
        {0, {0xC7, 0x71}, Layer::Cpio},
        {0, {0x71, 0xC7}, Layer::Cpio},
        {257, Bytes("ustar"), Layer::Tar},

        {0, {0x1F, 0x8B}, Layer::Gzip},
        {0, Bytes("BZh"), Layer::Bzip2},
        {0, {0xFD, '7', 'z', 'X', 'Z', 0x00}, Layer::Xz},
        {0, {0x1F, 0x9D}, Layer::Compress},
        {0, Bytes("LZIP"), Layer::Lzip},
        {0, Bytes("LRZI"), Layer::Lrzip},
        {0, {0x28, 0xB5, 0x2F, 0xFD}, Layer::Zstd},
        {0, {0x5D, 0x00, 0x00}, Layer::Lzma},
    };
    return kRules;
}

bool MatchesAt(std::span<const std::uint8_t> head, std::size_t offset,
               const std::vector<std::uint8_t>& bytes) {
    if (head.size() < offset + bytes.size()) return false;
    return std::equal(bytes.begin(), bytes.end(), head.begin() + static_cast<std::ptrdiff_t>(offset));
}

// LHA headers carry "-lh?-" or "-lz?-" at offset 2.
bool LooksLikeLzh(std::span<const std::uint8_t> head) {
    if (head.size() < 7) return false;
    return head[2] == '-' && head[3] == 'l' && (head[4] == 'h' || head[4] == 'z') &&
           head[6] == '-';
}

std::optional<Layer> MapArchiveFormat(int format) {
    switch (format & ARCHIVE_FORMAT_BASE_MASK) {
        case ARCHIVE_FORMAT_TAR:    return Layer::Tar;
        case ARCHIVE_FORMAT_CPIO:   return Layer::Cpio;
        case ARCHIVE_FORMAT_ZIP:    return Layer::Zip;
        case ARCHIVE_FORMAT_7ZIP:   return Layer::SevenZip;
        case ARCHIVE_FORMAT_RAR:    return Layer::Rar;
        case ARCHIVE_FORMAT_RAR_V5: return Layer::Rar;
        case ARCHIVE_FORMAT_LHA:    return Layer::Lzh;
        case ARCHIVE_FORMAT_CAB:    return Layer::Cab;
        default:                    return std::nullopt;
    }
}

struct ArchivePeek {
    int format = 0;
    std::vector<std::string> names;
};

// Reads up to `max_names` entry headers through libarchive, decompressing
// as needed. Nothing is written anywhere.
std::optional<ArchivePeek> PeekArchive(const std::string& path, std::size_t max_names) {
    ArchiveReadPtr a(archive_read_new());
    if (!a) return std::nullopt;

    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        LogDebug("libarchive probe of %s: %s", path.c_str(), archive_error_string(a.get()));
        return std::nullopt;
    }

    ArchivePeek peek;
    archive_entry* entry = nullptr;
    while (peek.names.size() < max_names) {
        const int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            if (peek.names.empty()) return std::nullopt;
            break;
        }
        const char* name = archive_entry_pathname(entry);
        peek.names.emplace_back(name ? name : "");
        (void)archive_read_data_skip(a.get());
    }
    peek.format = archive_format(a.get());
    if (peek.format == 0) return std::nullopt;
    return peek;
}

bool LooksLikeGem(const ArchivePeek& peek) {
    return std::any_of(peek.names.begin(), peek.names.end(), [](const std::string& n) {
        return n == "metadata.gz" || n == "data.tar.gz";
    });
}

// Self-extracting executables: earliest embedded archive signature wins.
std::optional<Layer> ScanForEmbeddedArchive(const FileReader& file) {
    constexpr std::size_t kChunk = 64 * 1024;
    constexpr std::size_t kOverlap = 8;
    constexpr std::uint64_t kMaxScan = 64ULL * 1024 * 1024;

    struct Signature {
        std::vector<std::uint8_t> bytes;
        Layer layer;
    };
    static const std::array<Signature, 3> kSignatures = {{
        {Bytes("PK\x03\x04"), Layer::Zip},
        {{'7', 'z', 0xBC, 0xAF, 0x27, 0x1C}, Layer::SevenZip},
        {Bytes("Rar!\x1A\x07"), Layer::Rar},
    }};

    const std::uint64_t limit = std::min<std::uint64_t>(file.TotalSize().value_or(0), kMaxScan);
    std::vector<std::uint8_t> buf(kChunk + kOverlap);

    for (std::uint64_t offset = 0; offset < limit; offset += kChunk) {
        const ssize_t n = file.ReadAt(offset, std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n <= 0) break;
        const auto begin = buf.begin();
        const auto end = buf.begin() + n;

        std::optional<Layer> best;
        auto best_pos = end;
        for (const auto& sig : kSignatures) {
            auto pos = std::search(begin, end, sig.bytes.begin(), sig.bytes.end());
            if (pos != end && pos < best_pos) {
                best_pos = pos;
                best = sig.layer;
            }
        }
        if (best) return best;
    }
    return std::nullopt;
}

std::string TrimArName(const char* field, std::size_t len) {
    std::string name(field, len);
    while (!name.empty() && (name.back() == ' ' || name.back() == '/')) name.pop_back();
    return name;
}

} // namespace

const std::vector<SuffixRule>& FormatClassifier::SuffixRules() {
    using L = Layer;
    static const std::vector<SuffixRule> kRules = {
        {".tar.gz", {L::Gzip, L::Tar}},
        {".tgz", {L::Gzip, L::Tar}},
        {".tar.bz2", {L::Bzip2, L::Tar}},
        {".tbz2", {L::Bzip2, L::Tar}},
        {".tb2", {L::Bzip2, L::Tar}},
        {".tbz", {L::Bzip2, L::Tar}},
        {".tar.xz", {L::Xz, L::Tar}},
        {".txz", {L::Xz, L::Tar}},
        {".tar.lzma", {L::Lzma, L::Tar}},
        {".tlz", {L::Lzma, L::Tar}},
        {".tar.lz", {L::Lzip, L::Tar}},
        {".tar.Z", {L::Compress, L::Tar}, true},
        {".taz", {L::Compress, L::Tar}},
        {".tar.lrz", {L::Lrzip, L::Tar}},
        {".tar.zst", {L::Zstd, L::Tar}},
        {".tar.zstd", {L::Zstd, L::Tar}},
        {".tzst", {L::Zstd, L::Tar}},
        {".tar.br", {L::Brotli, L::Tar}},
        {".tar", {L::Tar}},
        {".cpio.gz", {L::Gzip, L::Cpio}},
        {".cpio", {L::Cpio}},
        {".zip", {L::Zip}},
        {".jar", {L::Zip}},
        {".epub", {L::Zip}},
        {".xpi", {L::Zip}},
        {".crx", {L::Zip}},
        {".rar", {L::Rar}},
        {".7z", {L::SevenZip}},
        {".deb", {L::Deb}},
        {".rpm", {L::Rpm, L::Cpio}},
        {".gem", {L::Gem, L::Gzip, L::Tar}},
        {".lzh", {L::Lzh}},
        {".lha", {L::Lzh}},
        {".arj", {L::Arj}},
        {".cab", {L::Cab}, false, true},
        {".hdr", {L::InstallShield}},
        {".msi", {L::Msi}},
        {".dmg", {L::Dmg}},
        {".exe", {}, false, true},
        {".gz", {L::Gzip}},
        {".bz2", {L::Bzip2}},
        {".xz", {L::Xz}},
        {".lzma", {L::Lzma}},
        {".Z", {L::Compress}, true},
        {".lz", {L::Lzip}},
        {".lrz", {L::Lrzip}},
        {".zst", {L::Zstd}},
        {".zstd", {L::Zstd}},
        {".br", {L::Brotli}},
    };
    return kRules;
}

const SuffixRule* FormatClassifier::MatchSuffix(std::string_view filename) {
    const std::string lower = ToLower(std::string(filename));
    const SuffixRule* best = nullptr;
    for (const auto& rule : SuffixRules()) {
        if (filename.size() <= rule.suffix.size()) continue;
        const bool hit = rule.case_sensitive ? EndsWith(filename, rule.suffix)
                                             : EndsWith(lower, ToLower(rule.suffix));
        if (hit && (!best || rule.suffix.size() > best->suffix.size())) {
            best = &rule;
        }
    }
    return best;
}

std::optional<std::vector<Layer>> FormatClassifier::ClassifyByName(std::string_view filename) {
    const SuffixRule* rule = MatchSuffix(filename);
    if (!rule || rule->layers.empty()) return std::nullopt;
    return rule->layers;
}

std::vector<Layer> FormatClassifier::SniffContent(const FileReader& file) {
    std::array<std::uint8_t, kProbeBytes> buf{};
    const ssize_t n = file.ReadAt(0, std::span<std::uint8_t>(buf.data(), buf.size()));
    if (n <= 0) return {};
    const std::span<const std::uint8_t> head(buf.data(), static_cast<std::size_t>(n));

    std::optional<Layer> outer;
    for (const auto& rule : MagicRules()) {
        if (MatchesAt(head, rule.offset, rule.bytes)) {
            outer = rule.layer;
            break;
        }
    }
    if (!outer && LooksLikeLzh(head)) outer = Layer::Lzh;

    if (!outer && MatchesAt(head, 0, Bytes("MZ"))) {
        if (auto embedded = ScanForEmbeddedArchive(file)) return {*embedded};
        return {};
    }

    if (!outer) {
        // Older tar variants and anything else libarchive can identify.
        auto peek = PeekArchive(file.Path(), 4);
        if (!peek) return {};
        auto layer = MapArchiveFormat(peek->format);
        if (!layer) return {};
        if (*layer == Layer::Tar && LooksLikeGem(*peek)) return {Layer::Gem, Layer::Gzip, Layer::Tar};
        return {*layer};
    }

    switch (*outer) {
        case Layer::Deb:
            return {Layer::Deb};
        case Layer::Rpm:
            return {Layer::Rpm, Layer::Cpio};
        case Layer::Tar: {
            auto peek = PeekArchive(file.Path(), 4);
            if (peek && LooksLikeGem(*peek)) return {Layer::Gem, Layer::Gzip, Layer::Tar};
            return {Layer::Tar};
        }
        default:
            break;
    }

    if (IsCompressionFilter(*outer)) {
        std::vector<Layer> layers{*outer};
        if (auto peek = PeekArchive(file.Path(), 1)) {
            if (auto inner = MapArchiveFormat(peek->format)) layers.push_back(*inner);
        }
        return layers;
    }
    return {*outer};
}

Result FormatClassifier::ProbeDebMembers(const FileReader& file, DebMembers& out) {
    constexpr std::size_t kArHeader = 60;
    constexpr int kMaxMembers = 64;

    out = DebMembers{};

    std::array<std::uint8_t, 8> magic{};
    if (file.ReadAt(0, magic) != static_cast<ssize_t>(magic.size()) ||
        std::memcmp(magic.data(), "!<arch>\n", magic.size()) != 0) {
        return Result::Fail(ErrorKind::UnrecognizedFormat, "not an ar archive: " + file.Path());
    }

    std::uint64_t offset = magic.size();
    std::array<std::uint8_t, kArHeader> hdr{};
    for (int i = 0; i < kMaxMembers; ++i) {
        const ssize_t n = file.ReadAt(offset, hdr);
        if (n == 0) break;
        if (n != static_cast<ssize_t>(hdr.size()) || hdr[58] != '`' || hdr[59] != '\n') {
            return Result::Fail(ErrorKind::UnrecognizedFormat,
                                "malformed ar member header in " + file.Path());
        }

        const auto* raw = reinterpret_cast<const char*>(hdr.data());
        const std::string name = TrimArName(raw, 16);
        const std::string size_field = TrimArName(raw + 48, 10);

        std::uint64_t size = 0;
        for (char c : size_field) {
            if (c < '0' || c > '9') {
                return Result::Fail(ErrorKind::UnrecognizedFormat,
                                    "bad ar member size in " + file.Path());
            }
            size = size * 10 + static_cast<std::uint64_t>(c - '0');
        }

        if (out.data.empty() && StartsWith(name, "data.tar")) out.data = name;
        if (out.control.empty() && StartsWith(name, "control.tar")) out.control = name;

        offset += kArHeader + size + (size & 1U);
    }

    if (out.data.empty()) {
        return Result::Fail(ErrorKind::UnrecognizedFormat, ".deb contains no data.tar member");
    }
    return Result::Ok();
}

Result FormatClassifier::ExpandDeb(const FileReader& file, ArchiveSpec& spec) {
    DebMembers members;
    auto probe = ProbeDebMembers(file, members);
    if (!probe.is_ok()) return probe;

    auto inner = ClassifyByName(members.data);
    if (!inner || inner->back() != Layer::Tar) {
        return Result::Fail(ErrorKind::UnrecognizedFormat,
                            "data member has unrecognized encoding: " + members.data);
    }

    spec.layers = {Layer::Deb};
    spec.layers.insert(spec.layers.end(), inner->begin(), inner->end());
    spec.data_member = members.data;
    spec.control_member = members.control;
    return Result::Ok();
}

Result FormatClassifier::Classify(const std::string& path, Mode mode, ArchiveSpec& out) const {
    out = ArchiveSpec{};
    out.path = path;
    out.display_name = path;
    out.mode = mode;

    FileReader file;
    auto open_result = FileReader::Open(path, file);
    if (!open_result.is_ok()) return open_result;

    const std::string filename = std::filesystem::path(path).filename().string();
    const SuffixRule* rule = MatchSuffix(filename);

    if (rule && !rule->ambiguous) {
        out.layers = rule->layers;
        out.classified_by = ClassifiedBy::Extension;
    } else {
        auto sniffed = SniffContent(file);
        if (!sniffed.empty()) {
            out.layers = std::move(sniffed);
            out.classified_by = ClassifiedBy::Content;
        } else if (rule && !rule->layers.empty()) {
            out.layers = rule->layers;
            out.classified_by = ClassifiedBy::Extension;
        } else {
            return Result::Fail(ErrorKind::UnrecognizedFormat,
                                "not a known archive type: " + filename);
        }
    }

    if (out.layers.front() == Layer::Deb) {
        auto deb = ExpandDeb(file, out);
        if (!deb.is_ok()) return deb;
    }

    LogDebug("%s: classified as %s by %s",
             filename.c_str(),
             DescribeLayers(out.layers).c_str(),
             out.classified_by == ClassifiedBy::Extension ? "extension" : "content");
    return Result::Ok();
}

} // namespace peel
