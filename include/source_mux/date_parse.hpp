#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace smux {

// Limited ISO-8601 subset: YYYY-MM-DD[(T| )HH:MM:SS[.fff]][Z|(+|-)HH:MM].
// Returns epoch millis (UTC) on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

}
