#include "trialbox/concat_tostr.hh"
#include "trialbox/safety_scanner.hh"

namespace trialbox {

SafetyScanner::SafetyScanner()
: rules_{default_rules()} {}

SafetyVerdict SafetyScanner::check(std::string_view code) const {
    for (const auto& rule : rules_) {
        if (code.find(rule.pattern) != std::string_view::npos) {
            return {
                .is_safe = false,
                .reason = concat_tostr(
                    "Blocked: code contains '", rule.pattern, "' (", rule.category, ')'),
                .rule = rule,
            };
        }
    }
    return {
        .is_safe = true,
        .reason = "Code passed safety check",
        .rule = std::nullopt,
    };
}

std::vector<SafetyRule> SafetyScanner::default_rules() {
    return {
        {"import shutil", "filesystem manipulation"},
        {"rmdir", "directory deletion"},
        {"os.remove", "file deletion"},
        {"subprocess", "subprocess spawning"},
        {"__import__", "dynamic imports"},
        {"eval(", "dynamic code evaluation"},
        {"exec(", "dynamic code execution"},
        {"open(", "file system access"},
        {"socket", "network access"},
        {"requests", "network access"},
        {"urllib", "network access"},
    };
}

} // namespace trialbox
