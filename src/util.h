#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace keel {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Join parts with separator. Empty parts are kept.
std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

// Concatenate manifest documents in order, each introduced by a "---" separator line
// and terminated by a newline. Documents that are empty after trimming are skipped.
std::string util_join_manifests(std::vector<std::string> const &documents);

// Strip leading/trailing whitespace (space, tab, CR, LF).
std::string_view util_trim(std::string_view s);

}  // namespace keel
