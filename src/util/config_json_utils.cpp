#include "util/config_json_utils.hpp"

#include <fstream>

namespace peel::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer())
        return false;
    out = it->get<int>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool CheckType(const nlohmann::json& j, const char* key, bool ok, const char* expected,
               std::string& err) {
    if (j.contains(key) && !ok) {
        err = std::string(key) + " must be " + expected;
        return false;
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, PeelConfigFromFile& cfg, std::string& err) {
    {
        std::string s;
        if (!CheckType(j, "OneEntry", GetStringIfPresent(j, "OneEntry", s), "a string", err))
            return false;
        if (!s.empty())
            cfg.one_entry = s;
    }
    {
        std::string s;
        if (!CheckType(j, "Downloader", GetStringIfPresent(j, "Downloader", s), "a string", err))
            return false;
        if (!s.empty()) {
            if (s != "wget" && s != "curl") {
                err = "Downloader must be \"wget\" or \"curl\"";
                return false;
            }
            cfg.downloader = s;
        }
    }

    struct BoolKey {
        const char* key;
        std::optional<bool>* target;
    };
    for (const BoolKey& k : {BoolKey{"Recursive", &cfg.recursive},
                             BoolKey{"Noninteractive", &cfg.noninteractive},
                             BoolKey{"Overwrite", &cfg.overwrite}}) {
        bool b{};
        const bool found = GetBoolIfPresent(j, k.key, b);
        if (!CheckType(j, k.key, found, "a boolean", err))
            return false;
        if (found)
            *k.target = b;
    }

    {
        std::uint64_t v{};
        const bool found = GetU64IfPresent(j, "MaxRecursionDepth", v);
        if (!CheckType(j, "MaxRecursionDepth", found, "a non-negative integer", err))
            return false;
        if (found)
            cfg.max_recursion_depth = v;
    }
    {
        int v{};
        const bool found = GetIntIfPresent(j, "Verbosity", v);
        if (!CheckType(j, "Verbosity", found, "an integer", err))
            return false;
        if (found)
            cfg.verbosity = v;
    }

    return true;
}

} // namespace peel::config::detail
