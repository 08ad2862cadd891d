#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace notegraph::common {

inline constexpr std::size_t SHORT_HASH_LENGTH = 16;

[[nodiscard]] std::string sha256_hex(std::string_view data);

/// First 16 hex characters of the SHA-256 digest; used for file fingerprints.
[[nodiscard]] std::string short_content_hash(std::string_view data);

} // namespace notegraph::common
