#pragma once

#include <string>
#include <vector>

namespace runbox {

// Known mathematical constants for the verification pass
struct ReferenceConstant {
    std::string name;                   // Canonical tag, e.g. "pi"
    double value;
    std::vector<std::string> aliases;   // Accepted as request tags
    std::vector<std::string> markers;   // Matched as whole words in stdout
};

const std::vector<ReferenceConstant>& reference_constants();

// Case-insensitive lookup by name or alias; nullptr when unknown
const ReferenceConstant* find_reference_constant(const std::string& tag);

// First constant whose marker appears in text as a whole word; nullptr if none
const ReferenceConstant* detect_reference_constant(const std::string& text);

} // namespace runbox
