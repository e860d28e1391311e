#pragma once

#include <string>
#include <vector>

namespace mockrun {

// Languages accepted by the executor
constexpr const char* LANGUAGE_JAVASCRIPT = "javascript";   // Default, either strategy
constexpr const char* LANGUAGE_NODE = "node";               // Node runtime only (Heavy)

// Static pre-filter run before any environment is allocated. It rejects obvious
// misuse cheaply; the symbols bound into the sandbox are what actually confine code.
class CodeValidator {
public:
    // Throws ValidationError naming the offending construct
    static void validate(const std::string& code, const std::string& language);

    static bool is_supported_language(const std::string& language);
    static std::vector<std::string> supported_languages();

    // for(, while(, do{ occurrences
    static int count_loops(const std::string& code);
};

} // namespace mockrun
