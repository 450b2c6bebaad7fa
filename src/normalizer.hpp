#pragma once
#include <string>

namespace codegate {

// Strip surrounding whitespace and markdown code fences from a model-written
// payload. A leading "```python", "```<lang>" or bare "```" and a trailing
// "```" are removed, re-trimming after each step, until nothing changes.
// Never fails; may return "".
std::string normalize_code(const std::string& raw);

} // namespace codegate
