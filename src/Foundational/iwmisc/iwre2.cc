#include <string>
#include <string_view>

#include "Foundational/iwmisc/iwre2.h"

namespace iwre2 {
bool RE2FullMatch(std::string_view s, const RE2& rx) {
  return RE2::FullMatch(s, rx);
}
bool RE2FullMatch(std::string_view s, const RE2& rx, std::string& capture) {
  return RE2::FullMatch(s, rx, &capture);
}

}  // namespace iwre2
