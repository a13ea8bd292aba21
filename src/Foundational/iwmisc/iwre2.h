#ifndef FOUNDATIONAL_IWMISC_IW_RE2_H
#define FOUNDATIONAL_IWMISC_IW_RE2_H

#include <string>
#include <string_view>

#include "re2/re2.h"

namespace iwre2 {
bool RE2FullMatch(std::string_view s, const RE2& rx);

// Full match, returning the first capture group in `capture`.
bool RE2FullMatch(std::string_view s, const RE2& rx, std::string& capture);
}
#endif  // FOUNDATIONAL_IWMISC_IW_RE2_H
