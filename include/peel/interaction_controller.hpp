#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peel {

// What to do with an archive holding exactly one entry whose name differs
// from the archive's base name.
enum class OneEntryPolicy {
    Inside,
    Rename,
    Here,
};

const char* OneEntryPolicyName(OneEntryPolicy policy);
// Accepts any prefix of "inside", "rename" or "here".
std::expected<OneEntryPolicy, std::string> ParseOneEntryPolicy(std::string_view text);

enum class CollisionChoice {
    Rename,
    Overwrite,
    Skip,
};

struct SingleEntryQuestion {
    std::string archive;
    std::string base_name;
    std::string entry_name;
    bool entry_is_directory = false;
};

struct CollisionQuestion {
    std::string archive;
    std::string existing;
};

// Asks the user how to place ambiguous output. Never prompts when
// non-interactive; defaults apply instead.
class InteractionController {
  public:
    enum class State {
        Idle,
        AwaitingSingleEntryChoice,
        AwaitingOverwriteConfirmation,
    };

    class IPrompter {
      public:
        virtual ~IPrompter() = default;
        // Shows `lines` then `prompt`; nullopt on end of input.
        virtual std::optional<std::string> Ask(const std::vector<std::string>& lines,
                                               std::string_view prompt) = 0;
    };

    // Reads answers from stdin, writes questions to stdout.
    static std::shared_ptr<IPrompter> TerminalPrompter();

    InteractionController(bool interactive, std::optional<OneEntryPolicy> fixed_policy,
                          std::shared_ptr<IPrompter> prompter = nullptr);

    bool Interactive() const { return interactive_; }
    State CurrentState() const { return state_; }

    OneEntryPolicy ResolveSingleEntry(const SingleEntryQuestion& q);
    CollisionChoice ResolveCollision(const CollisionQuestion& q);

    // Same policy, never prompts. Used for nested archives.
    InteractionController Quiet() const;

  private:
    static constexpr int kMaxAttempts = 16;

    bool interactive_;
    std::optional<OneEntryPolicy> fixed_policy_;
    std::shared_ptr<IPrompter> prompter_;
    State state_ = State::Idle;
};

} // namespace peel
