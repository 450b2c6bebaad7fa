#pragma once
#include <functional>
#include <istream>
#include <ostream>
#include <string>

namespace codegate {

// Asks the operator whether to proceed. Returns true only on explicit approval.
using Confirmer = std::function<bool(const std::string& prompt)>;

extern const char* const kConfirmPrompt;

// Only "y" or "Y" approves. "yes", blank lines and EOF all decline.
bool is_affirmative(const std::string& answer);

// Prompt on `out`, read one line from `in`
class StreamConfirmer {
public:
    StreamConfirmer(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool operator()(const std::string& prompt);

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace codegate
