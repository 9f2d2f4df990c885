#pragma once

#include "peel/layer.hpp"
#include "util/result.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace peel {

// Placeholders instantiated by the pipeline compiler.
inline constexpr const char* kArchiveToken = "{archive}";
inline constexpr const char* kMemberToken = "{member}";
inline constexpr const char* kPasswordToken = "{password}";
// Expands to zero or more optional arguments (password, verbosity).
inline constexpr const char* kOptionsToken = "{options}";
// Resolved by the process runner once the materialized file exists.
inline constexpr const char* kMaterializedToken = "{materialized}";

enum class InputMode {
    Stdin,
    PathArgument,
};

// Output dialect of a tool's listing command.
enum class ListingFormat {
    Plain,
    SevenZip,
    Lsar,
    Cabextract,
    Lha,
    Arj,
    Unshield,
};

struct ToolCommand {
    std::string program;
    std::vector<std::string> args;
};

struct ToolSpec {
    std::string variant;
    Layer layer = Layer::Tar;
    InputMode input = InputMode::Stdin;

    // Extraction command; for a non-terminal layer, the command that
    // streams the decoded payload to stdout.
    ToolCommand extract;
    std::optional<ToolCommand> list;
    ListingFormat listing = ListingFormat::Plain;
    bool supports_metadata = false;

    // Extraction options for `-v` runs, which print each name to stdout,
    // and for quiet runs.
    std::vector<std::string> verbose_args;
    std::vector<std::string> quiet_args;
    std::vector<std::string> password_args;
    // Used in non-interactive runs when no password was given.
    std::vector<std::string> no_password_args;
    std::vector<int> ok_exit_codes{0};

    bool Streams() const { return input == InputMode::Stdin; }
};

// Process-wide cache of program name -> absolute path (or absent).
// Each name is resolved at most once.
class ToolAvailability {
  public:
    class ILocator {
      public:
        virtual ~ILocator() = default;
        virtual std::optional<std::string> Locate(std::string_view program) const = 0;
    };

    static ToolAvailability& Instance();

    explicit ToolAvailability(std::shared_ptr<const ILocator> locator);
    ToolAvailability(const ToolAvailability&) = delete;
    ToolAvailability& operator=(const ToolAvailability&) = delete;

    const std::optional<std::string>& Lookup(const std::string& program);
    bool Has(const std::string& program) { return Lookup(program).has_value(); }

    // $PATH search used by Instance().
    static std::shared_ptr<const ILocator> SearchPathLocator();

  private:
    std::shared_ptr<const ILocator> locator_;
    std::map<std::string, std::optional<std::string>, std::less<>> cache_;
};

enum class CommandKind {
    Extract,
    List,
};

class ToolRegistry {
  public:
    explicit ToolRegistry(ToolAvailability& availability);

    // Every known variant for `layer`, in preference order.
    static const std::vector<ToolSpec>& Variants(Layer layer);

    // First variant offering `kind` whose program is installed. Fails with
    // MissingTool naming the preferred variant's program.
    Result Select(Layer layer, CommandKind kind, const ToolSpec*& out);

    Result ResolveProgram(const std::string& program, std::string& out_path);

  private:
    Result Missing(const std::string& program, Layer layer);

    ToolAvailability& availability_;
    std::set<std::string> reported_missing_;
};

} // namespace peel
