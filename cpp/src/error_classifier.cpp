#include "../include/error_classifier.hpp"

#include <array>
#include <regex>
#include <string>
#include <vector>

namespace psrelay {
namespace core {

namespace {

struct HintPatterns {
    FailureHint hint;
    std::vector<std::regex> patterns;
};

std::regex icase(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
}

// Checked in order; the categories are meant to be mutually exclusive.
const std::array<HintPatterns, 4>& hint_table() {
    static const std::array<HintPatterns, 4> table{{
        {FailureHint::AccessDenied, {
            icase(R"(\baccess.*?not\s+allowed\b)"),
            icase(R"(\baccess.*?denied\b)"),
            icase(R"(PermissionDenied(?:Exception)?)"),
            icase(R"(SecurityException)"),
        }},
        {FailureHint::UserAborted, {
            // "This command cannot be run due to the error: The operation was canceled by the user."
            icase(R"(\boperation.*?cancell?ed\b)"),
            icase(R"(\bcancell?ed\s+by.*?user\b)"),
        }},
        {FailureHint::CommandNotFound, {
            // "The term 'hello' is not recognized as the name of a cmdlet, function, ..."
            icase(R"(\bthe\s+term.*?is\s+not\s+recogni[sz]ed\b)"),
            icase(R"(\bnot\s+recogni[sz]ed\s+as\s+the\s+name\s+of\b)"),
            icase(R"(CommandNotFound(?:Exception)?)"),
        }},
        {FailureHint::InterpreterDisabled, {
            // "This program is blocked by group policy. For more information, contact your system administrator."
            icase(R"(\bgroup\s+policy\b)"),
            icase(R"(\bcontact\s+your\s+system\s+admin)"),
        }},
    }};
    return table;
}

} // namespace

const char* to_string(FailureHint hint) noexcept {
    switch (hint) {
        case FailureHint::None:                return "none";
        case FailureHint::AccessDenied:        return "access-denied";
        case FailureHint::UserAborted:         return "user-aborted";
        case FailureHint::CommandNotFound:     return "command-not-found";
        case FailureHint::InterpreterDisabled: return "interpreter-disabled";
    }
    return "?";
}

FailureHint classify_failure(std::string_view output) {
    if (output.empty()) return FailureHint::None;
    const std::string text(output);
    for (const auto& entry : hint_table()) {
        for (const auto& re : entry.patterns) {
            if (std::regex_search(text, re)) {
                return entry.hint;
            }
        }
    }
    return FailureHint::None;
}

} // namespace core
} // namespace psrelay
