#include "peel/listing_parser.hpp"

#include <cctype>

namespace peel {

namespace {

std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string_view TrimLeft(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    return s;
}

std::string_view Trim(std::string_view s) {
    s = TrimLeft(s);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool OnlyChars(std::string_view s, std::string_view allowed) {
    if (s.empty()) return false;
    return s.find_first_not_of(allowed) == std::string_view::npos;
}

// Names are taken verbatim: they may begin or end with blanks.
void Push(std::vector<std::string>& out, std::string_view name) {
    if (!name.empty()) out.emplace_back(name);
}

// 7z -ba: fixed columns, the name starts at column 53.
std::vector<std::string> ParseSevenZip(std::string_view output) {
    constexpr std::size_t kNameColumn = 53;
    std::vector<std::string> out;
    for (auto line : SplitLines(output)) {
        if (line.size() > kNameColumn) {
            Push(out, line.substr(kNameColumn));
        } else if (auto sp = line.rfind(' '); sp != std::string_view::npos) {
            Push(out, line.substr(sp + 1));
        }
    }
    return out;
}

// lsar: first line names the archive; trailing "(...)" annotations dropped.
std::vector<std::string> ParseLsar(std::string_view output) {
    std::vector<std::string> out;
    const auto lines = SplitLines(output);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        std::string_view line = Trim(lines[i]);
        if (!line.empty() && line.back() == ')') {
            if (auto paren = line.rfind('('); paren != std::string_view::npos) {
                line = line.substr(0, paren);
            }
        }
        Push(out, Trim(line));
    }
    return out;
}

// cabextract -l: "  size | date time | name" rows after a dashed border.
std::vector<std::string> ParseCabextract(std::string_view output) {
    std::vector<std::string> out;
    bool in_body = false;
    for (auto line : SplitLines(output)) {
        if (!in_body) {
            in_body = OnlyChars(Trim(line), "-+");
            continue;
        }
        const auto first = line.find(" | ");
        if (first == std::string_view::npos) break;
        const auto second = line.find(" | ", first + 3);
        if (second == std::string_view::npos) break;
        Push(out, line.substr(second + 3));
    }
    return out;
}

// lha l: the name column starts after the last blank in the dashed border.
std::vector<std::string> ParseLha(std::string_view output) {
    std::vector<std::string> out;
    std::size_t name_column = std::string_view::npos;
    for (auto line : SplitLines(output)) {
        const bool border = OnlyChars(line, "- ") && line.find(' ') != std::string_view::npos &&
                            line.find('-') != std::string_view::npos;
        if (name_column == std::string_view::npos) {
            if (border) name_column = line.rfind(' ') + 1;
            continue;
        }
        if (border) break;
        if (line.size() > name_column) Push(out, line.substr(name_column));
    }
    return out;
}

// arj v: entries are numbered "001) name".
std::vector<std::string> ParseArj(std::string_view output) {
    std::vector<std::string> out;
    for (auto line : SplitLines(output)) {
        std::size_t i = 0;
        while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) ++i;
        if (i == 0 || i >= line.size() || line[i] != ')') continue;
        ++i;
        if (i >= line.size() || line[i] != ' ') continue;
        Push(out, line.substr(i + 1));
    }
    return out;
}

// unshield l: "  size  name" rows until the closing dashed rule.
std::vector<std::string> ParseUnshield(std::string_view output) {
    std::vector<std::string> out;
    for (auto line : SplitLines(output)) {
        if (line.empty() || !std::isspace(static_cast<unsigned char>(line.front()))) continue;
        const std::string_view body = TrimLeft(line);
        if (OnlyChars(Trim(body), "- ")) {
            if (!out.empty()) break;
            continue;
        }
        std::size_t i = 0;
        while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) ++i;
        if (i == 0 || i >= body.size() || body[i] != ' ') continue;
        // Two blanks separate the size from the name.
        std::string_view name = body.substr(i + 1);
        if (!name.empty() && name.front() == ' ') name.remove_prefix(1);
        Push(out, name);
    }
    return out;
}

} // namespace

std::vector<std::string> ParseListing(ListingFormat format, std::string_view output) {
    switch (format) {
        case ListingFormat::SevenZip:   return ParseSevenZip(output);
        case ListingFormat::Lsar:       return ParseLsar(output);
        case ListingFormat::Cabextract: return ParseCabextract(output);
        case ListingFormat::Lha:        return ParseLha(output);
        case ListingFormat::Arj:        return ParseArj(output);
        case ListingFormat::Unshield:   return ParseUnshield(output);
        case ListingFormat::Plain:      break;
    }
    std::vector<std::string> out;
    for (auto line : SplitLines(output)) {
        if (!line.empty()) out.emplace_back(line);
    }
    return out;
}

} // namespace peel
