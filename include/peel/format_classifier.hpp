#pragma once

#include "io/file_reader.hpp"
#include "peel/archive_spec.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peel {

struct SuffixRule {
    std::string suffix;
    std::vector<Layer> layers;
    bool case_sensitive = false;
    // The suffix alone cannot decide the format; content decides first.
    bool ambiguous = false;
};

struct DebMembers {
    std::string data;
    std::string control;
};

class FormatClassifier {
  public:
    static constexpr std::size_t kProbeBytes = 512;

    // Priority-ordered table of every recognized suffix.
    static const std::vector<SuffixRule>& SuffixRules();

    // Longest suffix rule matching `filename`; nullptr when none matches or
    // the suffix would leave an empty base name.
    static const SuffixRule* MatchSuffix(std::string_view filename);

    // Name-only classification, used for nested-archive discovery.
    static std::optional<std::vector<Layer>> ClassifyByName(std::string_view filename);

    // Magic-number probe of the leading bytes, looking one level inside a
    // recognized compression filter. Empty when nothing is recognized.
    static std::vector<Layer> SniffContent(const FileReader& file);

    // Locates data.tar.* and control.tar.* inside a Debian package.
    static Result ProbeDebMembers(const FileReader& file, DebMembers& out);

    Result Classify(const std::string& path, Mode mode, ArchiveSpec& out) const;

  private:
    static Result ExpandDeb(const FileReader& file, ArchiveSpec& spec);
};

} // namespace peel
