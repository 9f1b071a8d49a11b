#include "util.h"

#include <string>

namespace keel {

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string result;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i) { result.append(sep); }
    result.append(parts[i]);
  }
  return result;
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

std::string util_join_manifests(std::vector<std::string> const &documents) {
  std::string result;
  for (auto const &doc : documents) {
    std::string_view body{ util_trim(doc) };

    // Renderers may hand back text that already starts with a separator
    if (body.starts_with("---")) { body = util_trim(body.substr(3)); }
    if (body.empty()) { continue; }

    result.append("---\n");
    result.append(body);
    result.push_back('\n');
  }
  return result;
}

}  // namespace keel
