#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace objreg {

constexpr std::size_t  kMaxDescriptionLength = 100;   // characters, not bytes
constexpr std::int64_t kMinPriority = 1;
constexpr std::int64_t kMaxPriority = 3;

// UTF-8 code points in text: every byte that is not a continuation byte.
// Matches SQLite's length() on TEXT values.
std::size_t characterCount(std::string_view text);

bool isNonEmpty(std::string_view text);
bool isWithinLength(std::string_view text);
// SQLite's length() stops at the first NUL, so such text can never be stored.
bool isFreeOfNul(std::string_view text);
bool isValidPriority(std::int64_t value);
bool isValidOffset(std::int64_t offset);

} // namespace objreg
