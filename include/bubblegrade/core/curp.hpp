#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace bubblegrade::core {

inline constexpr std::size_t kCurpLength = 18;

/// Trim and drop every whitespace character (OCR tends to split the code).
[[nodiscard]] std::string normalize_curp_text(std::string_view raw);

/// Fixed CURP layout: 4 letters, 6 digits, H|M, 5 letters, 2 digits.
/// Only ASCII uppercase letters and digits are accepted.
[[nodiscard]] bool matches_curp_pattern(std::string_view text) noexcept;

/// Expected verification digit for the first 17 characters, or nullopt if
/// any character is outside [0-9A-Z].
[[nodiscard]] std::optional<char> curp_check_digit(std::string_view first17) noexcept;

/// Detailed breakdown of a CURP, used for diagnostics in exports.
/// Review decisions use matches_curp_pattern only.
struct CurpAnalysis {
  bool format_ok{false};
  bool forbidden_word{false};
  std::optional<std::string> birth_date;  // YYYY-MM-DD
  std::optional<std::string_view> federal_entity;
  std::optional<char> sex;                // 'H' or 'M' as printed
  bool check_digit_ok{false};

  [[nodiscard]] bool valid() const noexcept {
    return format_ok && !forbidden_word && birth_date.has_value() &&
           federal_entity.has_value() && check_digit_ok;
  }
};

[[nodiscard]] CurpAnalysis analyze_curp(std::string_view text);

}  // namespace bubblegrade::core
