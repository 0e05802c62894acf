#pragma once

#include <cstddef>
#include <string>

namespace semcache::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

// First `length` hex characters of the SHA-256 digest; used to tag queries in logs
// without writing prompt text to them.
[[nodiscard]] std::string short_digest(const std::string &text, std::size_t length = 12);

} // namespace semcache::common
