/**
 * bubblegrade-cli: Grade one scanned answer sheet; print the record as JSON.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/bubblegrade_cli --input sheet.jpg [--config path] [--backend local|remote]
 * Also writes the record to output/<basename>.json.
 */

#include <bubblegrade/app/config.hpp>
#include <bubblegrade/app/scan_json.hpp>
#include <bubblegrade/app/service_context.hpp>
#include <bubblegrade/core/correction.hpp>
#include <bubblegrade/core/scan_result.hpp>
#include <bubblegrade/vision/image_codec.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace ba = bubblegrade::app;
namespace bc = bubblegrade::core;

/// "nombre=JUAN PEREZ" -> correction; nullopt on unknown field or missing '='.
std::optional<bc::FieldCorrection> parse_correction(const std::string& arg,
                                                    const std::string& reviewer) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos) return std::nullopt;
  const auto field = bc::parse_field_kind(arg.substr(0, eq));
  if (!field) return std::nullopt;
  bc::FieldCorrection c;
  c.field = *field;
  c.text = arg.substr(eq + 1);
  c.corrected_by = reviewer;
  return c;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string backend_override;  // "local" or "remote"
  std::string log_level_override;
  std::string reviewer = "cli";
  std::vector<std::string> correction_args;
  bool check_health = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--correct" && i + 1 < argc) {
      correction_args.emplace_back(argv[++i]);
    } else if (arg == "--reviewer" && i + 1 < argc) {
      reviewer = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--health") {
      check_health = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: bubblegrade_cli --input <image> [options]\n"
                << "  --config <path>         Service config (key=value file); default: built-in\n"
                << "  --backend <type>        Override backend: local | remote\n"
                << "  --correct <field=text>  Apply a reviewer correction after grading (repeatable;\n"
                << "                          field is nombre or curp)\n"
                << "  --reviewer <name>       Name recorded on corrections (default: cli)\n"
                << "  --log-level <level>     trace | debug | info | warn | error\n"
                << "  --health                Check remote service health and exit\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  ba::AppConfig cfg;
  try {
    cfg = config_path.empty() ? ba::default_config() : ba::load_config(config_path);
    if (!backend_override.empty()) cfg.backend_type = ba::parse_backend_type(backend_override);
  } catch (const ba::ConfigError& e) {
    std::cerr << "Config error: " << e.what() << "\n";
    return 1;
  }
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  std::unique_ptr<ba::ServiceContext> service;
  try {
    service = ba::make_service_context(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Failed to start grading backend: " << e.what() << "\n";
    return 1;
  }

  if (check_health) {
    if (!service->remote) {
      std::cout << "local backend: no remote services to check\n";
      return 0;
    }
    const auto health = service->remote->check_health();
    std::cout << "omr: " << (health.omr ? "healthy" : "unavailable") << "\n"
              << "ocr: " << (health.ocr ? "healthy" : "unavailable") << "\n";
    return health.all_healthy() ? 0 : 1;
  }

  if (input_path.empty()) {
    std::cerr << "--input is required (see --help)\n";
    return 1;
  }

  std::vector<bc::FieldCorrection> corrections;
  for (const auto& arg : correction_args) {
    auto c = parse_correction(arg, reviewer);
    if (!c) {
      std::cerr << "Invalid --correct " << arg << " (expected nombre=<text> or curp=<text>)\n";
      return 1;
    }
    corrections.push_back(std::move(*c));
  }

  const std::filesystem::path p(input_path);
  const auto bytes = bubblegrade::vision::read_upload_file(p);
  if (!bytes) {
    std::cerr << "Failed to read image: " << bytes.error().message << "\n";
    return 1;
  }

  bc::StageTimingCallback timing = [](std::size_t stage, double ms) {
    spdlog::debug("stage {} took {:.2f} ms", stage, ms);
  };
  auto result = service->processor->process(*bytes, p.filename().string(), &timing);

  int exit_code = 0;
  std::string scan_id;
  if (result) {
    scan_id = result->id;
  } else {
    std::cerr << "Pipeline error: " << bc::to_string(result.error().code) << ": "
              << result.error().message << "\n";
    scan_id = result.error().scan_id;
    exit_code = 1;
  }

  if (result && !corrections.empty()) {
    auto corrected = service->processor->correct(scan_id, corrections);
    if (!corrected) {
      std::cerr << "Correction rejected: " << corrected.error().message << "\n";
      exit_code = 1;
    }
  }

  if (scan_id.empty()) return 1;
  auto record = service->processor->get(scan_id);
  if (!record) {
    std::cerr << "Record lookup failed: " << record.error().message << "\n";
    return 1;
  }

  const std::string text = ba::to_json(*record).dump(2) + "\n";
  std::cout << text;

  const std::filesystem::path out_dir("output");
  std::filesystem::create_directories(out_dir);
  const std::filesystem::path out_file = out_dir / (p.stem().string() + ".json");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
  return exit_code;
}
