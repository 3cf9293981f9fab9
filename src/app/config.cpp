#include <bubblegrade/app/config.hpp>
#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>

namespace bubblegrade::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
T parse_number(const std::string& key, const std::string& value) {
  T out{};
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    throw ConfigError("config: '" + key + "' expects a number, got '" + value + "'");
  }
  return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw ConfigError("config: '" + key + "' expects true/false, got '" + value + "'");
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.backend_type = BackendType::Local;
  c.endpoints.omr_url = "http://omr:8090";
  c.endpoints.ocr_url = "http://ocr:8091";
  c.endpoints.timeout = std::chrono::seconds(60);
  c.ocr_language = "spa";
  c.thresholds.nombre = 0.8f;
  c.thresholds.curp = 0.9f;
  c.parallel_grading = true;
  c.log_level = "info";
  return c;
}

BackendType parse_backend_type(std::string_view text) {
  if (text == "local") return BackendType::Local;
  if (text == "remote") return BackendType::Remote;
  throw ConfigError("unknown backend '" + std::string(text) + "' (expected local or remote)");
}

std::vector<char> parse_answer_key(std::string_view text) {
  std::vector<char> key;
  std::string item;
  auto flush = [&] {
    trim(item);
    if (item.size() != 1 || !std::isalpha(static_cast<unsigned char>(item[0]))) {
      throw ConfigError("answer_key entries must be single letters, got '" + item + "'");
    }
    key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(item[0]))));
    item.clear();
  };
  if (text.find_first_not_of(" \t") == std::string_view::npos) return key;
  for (char ch : text) {
    if (ch == ',') flush();
    else item.push_back(ch);
  }
  flush();
  return key;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "backend_type") c.backend_type = parse_backend_type(value);
    else if (key == "omr_url") c.endpoints.omr_url = value;
    else if (key == "ocr_url") c.endpoints.ocr_url = value;
    else if (key == "request_timeout_s")
      c.endpoints.timeout = std::chrono::seconds(parse_number<long>(key, value));
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "bilateral_diameter") {
      c.enhancer.bilateral_diameter = parse_number<int>(key, value);
      c.extractor.bilateral_diameter = c.enhancer.bilateral_diameter;
    }
    else if (key == "bilateral_sigma_color") {
      c.enhancer.bilateral_sigma_color = parse_number<double>(key, value);
      c.extractor.bilateral_sigma_color = c.enhancer.bilateral_sigma_color;
    }
    else if (key == "bilateral_sigma_space") {
      c.enhancer.bilateral_sigma_space = parse_number<double>(key, value);
      c.extractor.bilateral_sigma_space = c.enhancer.bilateral_sigma_space;
    }
    else if (key == "clahe_clip_limit") c.enhancer.clahe_clip_limit = parse_number<double>(key, value);
    else if (key == "clahe_tile_size") c.enhancer.clahe_tile_size = parse_number<int>(key, value);
    else if (key == "nombre_threshold") c.thresholds.nombre = parse_number<float>(key, value);
    else if (key == "curp_threshold") c.thresholds.curp = parse_number<float>(key, value);
    else if (key == "answer_key") c.answer_key = parse_answer_key(value);
    else if (key == "parallel_grading") c.parallel_grading = parse_bool(key, value);
    else if (key == "log_level") c.log_level = value;
  }
  return c;
}

}  // namespace bubblegrade::app
