#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialbox {

struct SafetyRule {
    std::string pattern; // matched as a plain substring
    std::string category; // e.g. "network access"

    bool operator==(const SafetyRule&) const = default;
};

struct SafetyVerdict {
    bool is_safe;
    std::string reason;
    std::optional<SafetyRule> rule; // the matched rule if the code is not safe
};

// Rejects code containing any of the blocklisted patterns. This is an advisory check: it is
// trivially evaded and reports false positives (e.g. patterns inside comments). Isolation is
// provided by the sandbox.
class SafetyScanner {
    std::vector<SafetyRule> rules_;

public:
    // Uses default_rules()
    SafetyScanner();

    explicit SafetyScanner(std::vector<SafetyRule> rules) noexcept
    : rules_{std::move(rules)} {}

    // Checks the rules in order and reports the first one that matches
    [[nodiscard]] SafetyVerdict check(std::string_view code) const;

    [[nodiscard]] const std::vector<SafetyRule>& rules() const noexcept { return rules_; }

    // Blocklist for Python code
    [[nodiscard]] static std::vector<SafetyRule> default_rules();
};

} // namespace trialbox
