#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace strata {

using placeholder_resolver_t = std::function<std::string(std::string_view name)>;

// Replace every ${<ns>:NAME} token in text with resolve(NAME). Tokens of other
// namespaces and unterminated tokens are copied through unchanged. The
// resolver reports unknown names by throwing.
std::string placeholders_expand(std::string_view text,
                                std::string_view ns,
                                placeholder_resolver_t const &resolve);

bool placeholders_contains(std::string_view text, std::string_view ns);

}  // namespace strata
