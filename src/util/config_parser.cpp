#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cstdlib>

namespace peel::config {

void PeelConfigFromFile::Reset() {
    one_entry.reset();
    recursive.reset();
    noninteractive.reset();
    overwrite.reset();
    max_recursion_depth.reset();
    verbosity.reset();
    downloader.reset();
}

bool PeelConfigFromFile::LoadFile(const std::string &path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogWarn("config: %s", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogWarn("config: %s in %s", err.c_str(), path.c_str());
        Reset();
        return false;
    }

    return true;
}

std::string PeelConfigFromFile::DefaultPath() {
    if (const char *explicit_path = std::getenv("PEEL_CONFIG"); explicit_path && *explicit_path) {
        return explicit_path;
    }
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/peel/config.json";
    }
    if (const char *home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/peel/config.json";
    }
    return {};
}

} // namespace peel::config
