#include "peel/tool_registry.hpp"

#include "util/logger.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <utility>

namespace peel {

namespace {

class PathLocator final : public ToolAvailability::ILocator {
  public:
    std::optional<std::string> Locate(std::string_view program) const override {
        if (program.empty()) return std::nullopt;
        if (program.find('/') != std::string_view::npos) {
            std::string path(program);
            if (IsExecutable(path)) return path;
            return std::nullopt;
        }

        const char* env = std::getenv("PATH");
        const std::string_view search = (env && *env) ? env : "/usr/local/bin:/usr/bin:/bin";
        std::size_t start = 0;
        while (start <= search.size()) {
            std::size_t end = search.find(':', start);
            if (end == std::string_view::npos) end = search.size();
            std::string dir(search.substr(start, end - start));
            if (dir.empty()) dir = ".";
            std::string candidate = dir + "/" + std::string(program);
            if (IsExecutable(candidate)) return candidate;
            start = end + 1;
        }
        return std::nullopt;
    }

  private:
    static bool IsExecutable(const std::string& path) {
        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) return false;
        if (!S_ISREG(st.st_mode)) return false;
        return ::access(path.c_str(), X_OK) == 0;
    }
};

ToolSpec Filter(Layer layer, std::string program, std::vector<std::string> args,
                std::vector<int> ok = {0}) {
    ToolSpec spec;
    spec.variant = program;
    spec.layer = layer;
    spec.extract = {std::move(program), std::move(args)};
    spec.ok_exit_codes = std::move(ok);
    return spec;
}

// 7-Zip reads nearly everything; it backs up the dedicated tools.
ToolSpec SevenZip(Layer layer, std::string program) {
    ToolSpec spec;
    spec.variant = program;
    spec.layer = layer;
    spec.input = InputMode::PathArgument;
    spec.extract = {program, {"x", "-y", kOptionsToken, kArchiveToken}};
    spec.list = ToolCommand{program, {"l", "-ba", kArchiveToken}};
    spec.listing = ListingFormat::SevenZip;
    spec.password_args = {std::string("-p") + kPasswordToken};
    return spec;
}

std::vector<ToolSpec> SevenZipFamily(Layer layer) {
    return {SevenZip(layer, "7z"), SevenZip(layer, "7za"), SevenZip(layer, "7zz")};
}

std::vector<ToolSpec> BuildVariants(Layer layer) {
    switch (layer) {
        case Layer::Gzip:
            return {Filter(layer, "gzip", {"-d", "-c"}, {0, 2})};
        case Layer::Bzip2:
            return {Filter(layer, "bzip2", {"-d", "-c"})};
        case Layer::Xz:
            return {Filter(layer, "xz", {"-d", "-c"})};
        case Layer::Lzma:
            return {Filter(layer, "xz", {"--format=lzma", "-d", "-c"}),
                    Filter(layer, "lzma", {"-d", "-c"})};
        case Layer::Compress:
            return {Filter(layer, "gzip", {"-d", "-c"}, {0, 2}),
                    Filter(layer, "uncompress", {"-c"})};
        case Layer::Lrzip: {
            ToolSpec spec = Filter(layer, "lrzcat", {kArchiveToken});
            spec.input = InputMode::PathArgument;
            return {spec};
        }
        case Layer::Lzip:
            return {Filter(layer, "lzip", {"-d", "-c"})};
        case Layer::Brotli:
            return {Filter(layer, "brotli", {"-d", "-c"})};
        case Layer::Zstd:
            return {Filter(layer, "zstd", {"-d", "-c", "-q"})};

        case Layer::Tar: {
            ToolSpec spec;
            spec.variant = "tar";
            spec.layer = layer;
            spec.extract = {"tar", {"-x", kOptionsToken, "-f", "-"}};
            spec.list = ToolCommand{"tar", {"-t", "-f", "-"}};
            spec.verbose_args = {"-v"};
            return {spec};
        }
        case Layer::Cpio: {
            ToolSpec spec;
            spec.variant = "cpio";
            spec.layer = layer;
            spec.extract = {"cpio",
                            {"-i", "--make-directories", "--quiet", "--no-absolute-filenames"}};
            spec.list = ToolCommand{"cpio", {"-t", "--quiet"}};
            return {spec};
        }
        case Layer::Rpm:
            return {Filter(layer, "rpm2cpio", {"-"})};
        case Layer::Deb: {
            ToolSpec spec = Filter(layer, "ar", {"p", kArchiveToken, kMemberToken});
            spec.input = InputMode::PathArgument;
            spec.supports_metadata = true;
            return {spec};
        }
        case Layer::Gem: {
            ToolSpec spec = Filter(layer, "tar", {"-x", "-O", "-f", "-", kMemberToken});
            spec.supports_metadata = true;
            return {spec};
        }

        case Layer::Zip: {
            ToolSpec unzip;
            unzip.variant = "unzip";
            unzip.layer = layer;
            unzip.input = InputMode::PathArgument;
            unzip.extract = {"unzip", {kOptionsToken, kArchiveToken}};
            unzip.quiet_args = {"-q"};
            unzip.list = ToolCommand{"zipinfo", {"-1", kArchiveToken}};
            unzip.password_args = {"-P", kPasswordToken};
            unzip.ok_exit_codes = {0, 1};
            std::vector<ToolSpec> out{unzip};
            for (auto& v : SevenZipFamily(layer)) out.push_back(std::move(v));
            return out;
        }
        case Layer::Rar: {
            ToolSpec unrar;
            unrar.variant = "unrar";
            unrar.layer = layer;
            unrar.input = InputMode::PathArgument;
            unrar.extract = {"unrar", {"x", "-y", kOptionsToken, kArchiveToken}};
            unrar.list = ToolCommand{"unrar", {"lb", kArchiveToken}};
            unrar.password_args = {std::string("-p") + kPasswordToken};
            unrar.no_password_args = {"-p-"};

            ToolSpec unar;
            unar.variant = "unar";
            unar.layer = layer;
            unar.input = InputMode::PathArgument;
            unar.extract = {"unar", {"-D", kOptionsToken, kArchiveToken}};
            unar.quiet_args = {"-q"};
            unar.list = ToolCommand{"lsar", {kArchiveToken}};
            unar.listing = ListingFormat::Lsar;
            unar.password_args = {"-p", kPasswordToken};

            std::vector<ToolSpec> out{unrar, unar};
            for (auto& v : SevenZipFamily(layer)) out.push_back(std::move(v));
            return out;
        }
        case Layer::SevenZip:
        case Layer::Msi:
        case Layer::Dmg:
            return SevenZipFamily(layer);
        case Layer::Cab: {
            ToolSpec spec;
            spec.variant = "cabextract";
            spec.layer = layer;
            spec.input = InputMode::PathArgument;
            spec.extract = {"cabextract", {kOptionsToken, kArchiveToken}};
            spec.quiet_args = {"-q"};
            spec.list = ToolCommand{"cabextract", {"-l", kArchiveToken}};
            spec.listing = ListingFormat::Cabextract;
            std::vector<ToolSpec> out{spec};
            for (auto& v : SevenZipFamily(layer)) out.push_back(std::move(v));
            return out;
        }
        case Layer::Lzh: {
            ToolSpec spec;
            spec.variant = "lha";
            spec.layer = layer;
            spec.input = InputMode::PathArgument;
            // The command letter carries the verbosity.
            spec.extract = {"lha", {kOptionsToken, kArchiveToken}};
            spec.verbose_args = {"x"};
            spec.quiet_args = {"xq"};
            spec.list = ToolCommand{"lha", {"l", kArchiveToken}};
            spec.listing = ListingFormat::Lha;
            std::vector<ToolSpec> out{spec};
            for (auto& v : SevenZipFamily(layer)) out.push_back(std::move(v));
            return out;
        }
        case Layer::Arj: {
            ToolSpec spec;
            spec.variant = "arj";
            spec.layer = layer;
            spec.input = InputMode::PathArgument;
            spec.extract = {"arj", {"x", "-y", kOptionsToken, kArchiveToken}};
            spec.list = ToolCommand{"arj", {"v", kArchiveToken}};
            spec.listing = ListingFormat::Arj;
            spec.password_args = {std::string("-g") + kPasswordToken};
            std::vector<ToolSpec> out{spec};
            for (auto& v : SevenZipFamily(layer)) out.push_back(std::move(v));
            return out;
        }
        case Layer::InstallShield: {
            ToolSpec spec;
            spec.variant = "unshield";
            spec.layer = layer;
            spec.input = InputMode::PathArgument;
            spec.extract = {"unshield", {"x", kArchiveToken}};
            spec.list = ToolCommand{"unshield", {"l", kArchiveToken}};
            spec.listing = ListingFormat::Unshield;
            return {spec};
        }
    }
    return {};
}

} // namespace

ToolAvailability& ToolAvailability::Instance() {
    static ToolAvailability inst(SearchPathLocator());
    return inst;
}

ToolAvailability::ToolAvailability(std::shared_ptr<const ILocator> locator)
    : locator_(std::move(locator)) {}

std::shared_ptr<const ToolAvailability::ILocator> ToolAvailability::SearchPathLocator() {
    return std::make_shared<PathLocator>();
}

const std::optional<std::string>& ToolAvailability::Lookup(const std::string& program) {
    auto it = cache_.find(program);
    if (it != cache_.end()) return it->second;

    std::optional<std::string> found = locator_ ? locator_->Locate(program) : std::nullopt;
    if (found) {
        LogDebug("found %s at %s", program.c_str(), found->c_str());
    } else {
        LogDebug("%s not found", program.c_str());
    }
    return cache_.emplace(program, std::move(found)).first->second;
}

ToolRegistry::ToolRegistry(ToolAvailability& availability) : availability_(availability) {}

const std::vector<ToolSpec>& ToolRegistry::Variants(Layer layer) {
    static const std::map<Layer, std::vector<ToolSpec>> table = [] {
        std::map<Layer, std::vector<ToolSpec>> t;
        for (int i = static_cast<int>(Layer::Gzip); i <= static_cast<int>(Layer::Dmg); ++i) {
            const auto layer = static_cast<Layer>(i);
            t.emplace(layer, BuildVariants(layer));
        }
        return t;
    }();
    return table.at(layer);
}

Result ToolRegistry::Select(Layer layer, CommandKind kind, const ToolSpec*& out) {
    out = nullptr;
    const auto& variants = Variants(layer);
    const ToolSpec* preferred = nullptr;

    for (const auto& v : variants) {
        const ToolCommand* cmd = &v.extract;
        if (kind == CommandKind::List) {
            if (!v.list) continue;
            cmd = &*v.list;
        }
        if (!preferred) preferred = &v;
        if (availability_.Has(cmd->program)) {
            out = &v;
            return Result::Ok();
        }
    }

    if (!preferred) {
        return Result::Fail(ErrorKind::UnsupportedMode,
                            std::string("cannot ") + (kind == CommandKind::List ? "list" : "extract") +
                                " " + LayerName(layer) + " archives");
    }
    const std::string& program =
        kind == CommandKind::List ? preferred->list->program : preferred->extract.program;
    return Missing(program, layer);
}

Result ToolRegistry::ResolveProgram(const std::string& program, std::string& out_path) {
    const auto& found = availability_.Lookup(program);
    if (!found) {
        if (reported_missing_.insert(program).second) {
            LogError("required tool '%s' is not installed", program.c_str());
        }
        return Result::Fail(ErrorKind::MissingTool,
                            "required tool '" + program + "' is not installed");
    }
    out_path = *found;
    return Result::Ok();
}

Result ToolRegistry::Missing(const std::string& program, Layer layer) {
    if (reported_missing_.insert(program).second) {
        LogError("required tool '%s' is not installed (needed for %s)", program.c_str(),
                 LayerName(layer));
    }
    return Result::Fail(ErrorKind::MissingTool, "required tool '" + program +
                                                    "' is not installed (needed for " +
                                                    LayerName(layer) + ")");
}

} // namespace peel
