#include "placeholders.h"

namespace strata {

std::string placeholders_expand(std::string_view text,
                                std::string_view ns,
                                placeholder_resolver_t const &resolve) {
  std::string const open{ "${" + std::string(ns) + ":" };

  std::string out;
  out.reserve(text.size());

  std::size_t pos{ 0 };
  for (;;) {
    auto const start{ text.find(open, pos) };
    if (start == std::string_view::npos) { break; }

    auto const name_begin{ start + open.size() };
    auto const close{ text.find('}', name_begin) };
    if (close == std::string_view::npos) { break; }

    out.append(text.substr(pos, start - pos));
    out.append(resolve(text.substr(name_begin, close - name_begin)));
    pos = close + 1;
  }

  out.append(text.substr(pos));
  return out;
}

bool placeholders_contains(std::string_view text, std::string_view ns) {
  return text.find("${" + std::string(ns) + ":") != std::string_view::npos;
}

}  // namespace strata
