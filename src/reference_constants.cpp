#include "reference_constants.h"
#include <algorithm>
#include <cctype>

namespace runbox {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool contains_word(const std::string& haystack, const std::string& word) {
    size_t pos = 0;
    while ((pos = haystack.find(word, pos)) != std::string::npos) {
        bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
        size_t end = pos + word.size();
        bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = end;
    }
    return false;
}

} // namespace

const std::vector<ReferenceConstant>& reference_constants() {
    static const std::vector<ReferenceConstant> constants = {
        {"pi", 3.14159265358979323846, {"π"}, {"pi", "π"}},
        {"e", 2.71828182845904523536, {"euler", "euler_number"},
         {"euler's number", "e constant", "exp(1)"}},
        {"golden_ratio", 1.61803398874989484820, {"phi", "φ"},
         {"golden ratio", "golden_ratio", "phi", "φ"}},
        {"sqrt2", 1.41421356237309504880, {"sqrt(2)", "√2"},
         {"sqrt(2)", "sqrt2", "square root of 2", "√2"}},
        {"sqrt3", 1.73205080756887729353, {"sqrt(3)", "√3"},
         {"sqrt(3)", "sqrt3", "square root of 3", "√3"}},
        {"ln2", 0.69314718055994530942, {"ln(2)", "natural_log_2"},
         {"ln(2)", "ln2", "natural log of 2", "log(2)"}},
        {"euler_gamma", 0.57721566490153286061, {"gamma", "euler_mascheroni"},
         {"euler-mascheroni", "euler_gamma", "euler gamma"}},
    };
    return constants;
}

const ReferenceConstant* find_reference_constant(const std::string& tag) {
    std::string wanted = to_lower(tag);
    for (const auto& constant : reference_constants()) {
        if (constant.name == wanted) {
            return &constant;
        }
        for (const auto& alias : constant.aliases) {
            if (alias == wanted) {
                return &constant;
            }
        }
    }
    return nullptr;
}

const ReferenceConstant* detect_reference_constant(const std::string& text) {
    std::string lowered = to_lower(text);
    for (const auto& constant : reference_constants()) {
        for (const auto& marker : constant.markers) {
            if (contains_word(lowered, marker)) {
                return &constant;
            }
        }
    }
    return nullptr;
}

} // namespace runbox
