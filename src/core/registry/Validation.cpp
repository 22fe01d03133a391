#include "Validation.hpp"

namespace objreg {

std::size_t characterCount(std::string_view text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

bool isNonEmpty(std::string_view text) {
  return !text.empty();
}

bool isWithinLength(std::string_view text) {
  return characterCount(text) <= kMaxDescriptionLength;
}

bool isFreeOfNul(std::string_view text) {
  return text.find('\0') == std::string_view::npos;
}

bool isValidPriority(std::int64_t value) {
  return value >= kMinPriority && value <= kMaxPriority;
}

bool isValidOffset(std::int64_t offset) {
  return offset > 0;
}

} // namespace objreg
