#include "peel/interaction_controller.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <iostream>

namespace peel {

namespace {

class StdioPrompter final : public InteractionController::IPrompter {
  public:
    std::optional<std::string> Ask(const std::vector<std::string>& lines,
                                   std::string_view prompt) override {
        for (const auto& l : lines) std::cout << l << '\n';
        std::cout << prompt << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            std::cout << '\n';
            return std::nullopt;
        }
        return answer;
    }
};

std::string Clean(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
    std::size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    return ToLower(s.substr(i));
}

} // namespace

const char* OneEntryPolicyName(OneEntryPolicy policy) {
    switch (policy) {
        case OneEntryPolicy::Inside: return "inside";
        case OneEntryPolicy::Rename: return "rename";
        case OneEntryPolicy::Here:   return "here";
    }
    return "inside";
}

std::expected<OneEntryPolicy, std::string> ParseOneEntryPolicy(std::string_view text) {
    const std::string lower = ToLower(std::string(text));
    if (lower.empty()) {
        return std::unexpected("missing one-entry policy");
    }
    for (const auto p : {OneEntryPolicy::Inside, OneEntryPolicy::Rename, OneEntryPolicy::Here}) {
        if (StartsWith(OneEntryPolicyName(p), lower)) return p;
    }
    return std::unexpected("invalid one-entry policy '" + std::string(text) +
                           "' (expected inside, rename or here)");
}

std::shared_ptr<InteractionController::IPrompter> InteractionController::TerminalPrompter() {
    return std::make_shared<StdioPrompter>();
}

InteractionController::InteractionController(bool interactive,
                                             std::optional<OneEntryPolicy> fixed_policy,
                                             std::shared_ptr<IPrompter> prompter)
    : interactive_(interactive), fixed_policy_(fixed_policy),
      prompter_(prompter ? std::move(prompter) : TerminalPrompter()) {}

InteractionController InteractionController::Quiet() const {
    return InteractionController(false, fixed_policy_, prompter_);
}

OneEntryPolicy InteractionController::ResolveSingleEntry(const SingleEntryQuestion& q) {
    if (fixed_policy_) return *fixed_policy_;
    if (!interactive_) return OneEntryPolicy::Inside;

    const char* what = q.entry_is_directory ? "directory" : "file";
    const std::vector<std::string> lines = {
        q.archive + " contains one " + what + " but its name doesn't match.",
        " Expected: " + q.base_name,
        "   Actual: " + q.entry_name,
        "You can:",
        " * extract the " + std::string(what) + " _I_nside another directory",
        " * extract the " + std::string(what) + " and _R_ename it",
        " * extract the " + std::string(what) + " _H_ere",
    };

    state_ = State::AwaitingSingleEntryChoice;
    OneEntryPolicy choice = OneEntryPolicy::Inside;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        auto answer = prompter_->Ask(attempt == 0 ? lines : std::vector<std::string>{},
                                     "What do you want to do?  (I/r/h) ");
        if (!answer) break;
        const std::string a = Clean(*answer);
        if (a.empty() || a == "i") break;
        if (a == "r") {
            choice = OneEntryPolicy::Rename;
            break;
        }
        if (a == "h") {
            choice = OneEntryPolicy::Here;
            break;
        }
    }
    state_ = State::Idle;
    LogDebug("%s: single entry placed %s", q.archive.c_str(), OneEntryPolicyName(choice));
    return choice;
}

CollisionChoice InteractionController::ResolveCollision(const CollisionQuestion& q) {
    if (!interactive_) return CollisionChoice::Rename;

    const std::vector<std::string> lines = {
        q.existing + " already exists.",
        "You can:",
        " * _R_ename the new output",
        " * _O_verwrite the existing " + q.existing,
        " * _S_kip " + q.archive,
    };

    state_ = State::AwaitingOverwriteConfirmation;
    CollisionChoice choice = CollisionChoice::Rename;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        auto answer = prompter_->Ask(attempt == 0 ? lines : std::vector<std::string>{},
                                     "What do you want to do?  (R/o/s) ");
        if (!answer) break;
        const std::string a = Clean(*answer);
        if (a.empty() || a == "r") break;
        if (a == "o") {
            choice = CollisionChoice::Overwrite;
            break;
        }
        if (a == "s") {
            choice = CollisionChoice::Skip;
            break;
        }
    }
    state_ = State::Idle;
    return choice;
}

} // namespace peel
