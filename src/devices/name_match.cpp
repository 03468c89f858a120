#include "name_match.hpp"

#include <algorithm>
#include <cctype>

namespace pwrctrl {

static std::string to_lower(const std::string &s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool matches(const std::string &pattern, const std::string &candidate) {
  if (pattern.empty()) {
    return candidate.empty();
  }
  if (pattern.size() > candidate.size()) {
    return false;
  }
  return to_lower(candidate).find(to_lower(pattern)) != std::string::npos;
}

} // namespace pwrctrl
