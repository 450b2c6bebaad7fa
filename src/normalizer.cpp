#include "normalizer.hpp"
#include "util.hpp"

#include <cctype>

namespace codegate {

namespace {

const std::string kFence = "```";
const std::string kPythonFence = "```python";

bool is_tag_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '+' || c == '-' || c == '.' || c == '#';
}

// Length of the language tag following an opening fence ("py" in "```py\n"),
// or 0 when the fence is bare. A tag must end the line.
size_t language_tag_length(const std::string& code) {
    size_t i = kFence.size();
    while (i < code.size() && is_tag_char(code[i])) ++i;
    if (i == kFence.size()) return 0;
    if (i < code.size() && code[i] != '\n' && code[i] != '\r') return 0;
    return i - kFence.size();
}

std::string strip_once(const std::string& raw) {
    std::string code = trim(raw);

    if (starts_with(code, kFence)) {
        size_t tag = language_tag_length(code);
        if (tag == 0 && starts_with(code, kPythonFence)) {
            tag = kPythonFence.size() - kFence.size();
        }
        code = trim(code.substr(kFence.size() + tag));
    }

    if (ends_with(code, kFence)) {
        code = trim(code.substr(0, code.size() - kFence.size()));
    }

    return code;
}

} // namespace

std::string normalize_code(const std::string& raw) {
    // Nested fences ("```\n```python ...") peel one layer per pass
    std::string code = strip_once(raw);
    for (;;) {
        std::string next = strip_once(code);
        if (next == code) return code;
        code = std::move(next);
    }
}

} // namespace codegate
