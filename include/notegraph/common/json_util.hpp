#pragma once

#include <string>

namespace notegraph::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Shortest round-trippable rendering of a finite double; non-finite values become 0.
[[nodiscard]] std::string json_number(double value);

} // namespace notegraph::common
