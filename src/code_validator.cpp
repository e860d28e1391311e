#include "code_validator.h"
#include "constants.h"
#include "errors.h"
#include <regex>
#include <iostream>

namespace mockrun {

namespace {

struct DenyRule {
    std::regex pattern;
    const char* description;
};

const std::vector<DenyRule>& deny_rules() {
    static const std::string modules =
        "(node:)?(fs|fs/promises|child_process|net|http|https|http2|os|dgram|worker_threads|vm|cluster)";

    static const std::vector<DenyRule> rules = {
        // Filesystem, process, network and system modules
        {std::regex("\\b(require|import)\\s*\\(\\s*['\"`]" + modules + "['\"`]\\s*\\)"),
         "restricted module import"},
        {std::regex("\\bfrom\\s*['\"`]" + modules + "['\"`]"), "restricted module import"},

        // Process control
        {std::regex("\\bprocess\\s*\\.\\s*(exit|kill|abort|binding|dlopen)\\s*\\("), "process control"},

        // Dynamic code
        {std::regex("(^|[^\\w$])eval\\s*\\("), "eval"},
        {std::regex("\\bnew\\s+Function\\b"), "dynamic function construction"},
        {std::regex("(^|[^\\w$])Function\\s*\\("), "dynamic function construction"},

        // Unbounded loops
        {std::regex("\\bwhile\\s*\\(\\s*(true|1)\\s*\\)"), "unbounded loop"},
        {std::regex("\\bfor\\s*\\(\\s*;\\s*;\\s*\\)"), "unbounded loop"},

        // Memory bombs
        {std::regex("\\bArray\\s*\\(\\s*\\d{5,}"), "very large array allocation"},
    };
    return rules;
}

} // namespace

bool CodeValidator::is_supported_language(const std::string& language) {
    return language == LANGUAGE_JAVASCRIPT || language == LANGUAGE_NODE;
}

std::vector<std::string> CodeValidator::supported_languages() {
    return {LANGUAGE_JAVASCRIPT, LANGUAGE_NODE};
}

int CodeValidator::count_loops(const std::string& code) {
    static const std::regex loop_pattern("\\b(for|while)\\s*\\(|\\bdo\\s*\\{");
    return static_cast<int>(std::distance(
        std::sregex_iterator(code.begin(), code.end(), loop_pattern),
        std::sregex_iterator()));
}

void CodeValidator::validate(const std::string& code, const std::string& language) {
    if (!is_supported_language(language)) {
        throw ValidationError("Unsupported language: " + language, "UNSUPPORTED_LANGUAGE");
    }

    if (code.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Code is required");
    }

    if (code.size() > MAX_CODE_LENGTH) {
        throw ValidationError("Code exceeds maximum length of " +
                              std::to_string(MAX_CODE_LENGTH) + " characters");
    }

    for (const auto& rule : deny_rules()) {
        std::smatch match;
        if (std::regex_search(code, match, rule.pattern)) {
            std::string construct = match.str(0);
            // Drop the boundary character captured in front of the name
            size_t start = construct.find_first_not_of(" \t\r\n;,(){}[]=+-*/!&|?:<>.");
            if (start != std::string::npos) {
                construct = construct.substr(start);
            }
            std::cerr << "[Executor] Blocked " << rule.description << ": " << construct << std::endl;
            throw ValidationError("Code contains prohibited operation (" +
                                  std::string(rule.description) + "): " + construct);
        }
    }

    int loops = count_loops(code);
    if (loops > MAX_LOOP_CONSTRUCTS) {
        throw ValidationError("Too many loops (" + std::to_string(loops) +
                              "). Maximum allowed: " + std::to_string(MAX_LOOP_CONSTRUCTS));
    }
}

} // namespace mockrun
