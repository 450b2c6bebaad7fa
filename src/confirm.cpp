#include "confirm.hpp"
#include "util.hpp"

namespace codegate {

const char* const kConfirmPrompt = "Do you want to execute this cleaned code? [y/N]: ";

bool is_affirmative(const std::string& answer) {
    return to_lower(answer) == "y";
}

bool StreamConfirmer::operator()(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return is_affirmative(line);
}

} // namespace codegate
