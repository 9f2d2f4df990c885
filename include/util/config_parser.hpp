#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace peel::config {

// User defaults read from config.json. Every key is optional; command-line
// flags override whatever is set here.
class PeelConfigFromFile {
public:
    std::optional<std::string> one_entry;
    std::optional<bool> recursive;
    std::optional<bool> noninteractive;
    std::optional<bool> overwrite;
    std::optional<std::uint64_t> max_recursion_depth;
    std::optional<int> verbosity;
    std::optional<std::string> downloader;

    bool LoadFile(const std::string &path);

    void Reset();

    // $PEEL_CONFIG, else $XDG_CONFIG_HOME/peel/config.json, else
    // ~/.config/peel/config.json. Empty when none can be formed.
    static std::string DefaultPath();
};

} // namespace peel::config
