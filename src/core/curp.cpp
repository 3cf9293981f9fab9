#include <bubblegrade/core/curp.hpp>
#include <algorithm>
#include <array>
#include <cstdio>
#include <utility>

namespace bubblegrade::core {

namespace {

bool is_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 33> kFederalEntities{{
    {"AS", "AGUASCALIENTES"},     {"BC", "BAJA CALIFORNIA"},
    {"BS", "BAJA CALIFORNIA SUR"}, {"CC", "CAMPECHE"},
    {"CL", "COAHUILA"},           {"CM", "COLIMA"},
    {"CS", "CHIAPAS"},            {"CH", "CHIHUAHUA"},
    {"DF", "CIUDAD DE MEXICO"},   {"DG", "DURANGO"},
    {"GT", "GUANAJUATO"},         {"GR", "GUERRERO"},
    {"HG", "HIDALGO"},            {"JC", "JALISCO"},
    {"MC", "MEXICO"},             {"MN", "MICHOACAN"},
    {"MS", "MORELOS"},            {"NT", "NAYARIT"},
    {"NL", "NUEVO LEON"},         {"OC", "OAXACA"},
    {"PL", "PUEBLA"},             {"QT", "QUERETARO"},
    {"QR", "QUINTANA ROO"},       {"SP", "SAN LUIS POTOSI"},
    {"SL", "SINALOA"},            {"SR", "SONORA"},
    {"TC", "TABASCO"},            {"TS", "TAMAULIPAS"},
    {"TL", "TLAXCALA"},           {"VZ", "VERACRUZ"},
    {"YN", "YUCATAN"},            {"ZS", "ZACATECAS"},
    {"NE", "NACIDO EN EL EXTRANJERO"},
}};

// Leading four letters that RENAPO replaces because they spell offensive words.
constexpr std::array<std::string_view, 81> kForbiddenWords{
    "BACA", "BAKA", "BUEI", "BUEY", "CACA", "CACO", "CAGA", "CAGO", "CAKA",
    "CAKO", "COGE", "COGI", "COJA", "COJE", "COJI", "COJO", "COLA", "CULO",
    "FALO", "FETO", "GETA", "GUEI", "GUEY", "JETA", "JOTO", "KACA", "KACO",
    "KAGA", "KAGO", "KAKA", "KAKO", "KOGE", "KOGI", "KOJA", "KOJE", "KOJI",
    "KOJO", "KOLA", "KULO", "LILO", "LOCA", "LOCO", "LOKA", "LOKO", "MAME",
    "MAMO", "MEAR", "MEAS", "MEON", "MIAR", "MION", "MOCO", "MOKO", "MULA",
    "MULO", "NACA", "NACO", "PEDA", "PEDO", "PENE", "PIPI", "PITO", "POPO",
    "PUTA", "PUTO", "QULO", "RATA", "ROBA", "ROBE", "ROBO", "RUIN", "SENO",
    "TETA", "VACA", "VAGA", "VAGO", "VAKA", "VUEI", "VUEY", "WUEI", "WUEY",
};

int two_digits(std::string_view s, std::size_t pos) noexcept {
  return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

bool is_leap(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

std::optional<std::string> birth_date_of(std::string_view curp) {
  const int yy = two_digits(curp, 4);
  const int month = two_digits(curp, 6);
  const int day = two_digits(curp, 8);
  const int year = yy <= 30 ? 2000 + yy : 1900 + yy;
  if (month < 1 || month > 12 || day < 1) return std::nullopt;
  static constexpr std::array<int, 12> kDays{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int max_day = kDays[static_cast<std::size_t>(month - 1)];
  if (month == 2 && is_leap(year)) max_day = 29;
  if (day > max_day) return std::nullopt;
  char buf[11];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return std::string(buf);
}

}  // namespace

std::string normalize_curp_text(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (!is_space(c)) out.push_back(c);
  }
  return out;
}

bool matches_curp_pattern(std::string_view text) noexcept {
  if (text.size() != kCurpLength) return false;
  for (std::size_t i = 0; i < kCurpLength; ++i) {
    const char c = text[i];
    bool ok = false;
    if (i < 4) ok = is_upper(c);
    else if (i < 10) ok = is_digit(c);
    else if (i == 10) ok = c == 'H' || c == 'M';
    else if (i < 16) ok = is_upper(c);
    else ok = is_digit(c);
    if (!ok) return false;
  }
  return true;
}

std::optional<char> curp_check_digit(std::string_view first17) noexcept {
  if (first17.size() < kCurpLength - 1) return std::nullopt;
  int sum = 0;
  for (std::size_t i = 0; i < kCurpLength - 1; ++i) {
    const char c = first17[i];
    int value = 0;
    if (is_digit(c)) value = c - '0';
    else if (is_upper(c)) value = 10 + (c - 'A');
    else return std::nullopt;
    sum += value * static_cast<int>(kCurpLength - i);
  }
  const int remainder = sum % 10;
  return static_cast<char>('0' + (remainder == 0 ? 0 : 10 - remainder));
}

CurpAnalysis analyze_curp(std::string_view text) {
  CurpAnalysis out;
  out.format_ok = matches_curp_pattern(text);
  if (!out.format_ok) return out;

  const std::string_view prefix = text.substr(0, 4);
  out.forbidden_word = std::find(kForbiddenWords.begin(), kForbiddenWords.end(), prefix) !=
                       kForbiddenWords.end();
  out.birth_date = birth_date_of(text);
  out.sex = text[10];

  const std::string_view entity = text.substr(11, 2);
  for (const auto& [code, name] : kFederalEntities) {
    if (code == entity) {
      out.federal_entity = name;
      break;
    }
  }

  const auto expected = curp_check_digit(text);
  out.check_digit_ok = expected.has_value() && *expected == text[kCurpLength - 1];
  return out;
}

}  // namespace bubblegrade::core
