#include <bubblegrade/app/scan_json.hpp>
#include <bubblegrade/core/curp.hpp>
#include <spdlog/fmt/chrono.h>
#include <ctime>

namespace bubblegrade::app {

namespace bc = bubblegrade::core;
using nlohmann::json;

namespace {

json box_json(const bc::RegionBoundingBox& b) {
  return {{"x", b.x}, {"y", b.y}, {"width", b.width}, {"height", b.height}};
}

json quality_json(const bc::ImageQuality& q) {
  return {{"resolution", {{"width", q.width}, {"height", q.height}}},
          {"clarity", q.clarity},
          {"skew", q.skew}};
}

json field_json(const bc::FieldResult& f) {
  json j{{"text", f.text}, {"confidence", f.confidence}, {"needs_review", f.needs_review}};
  if (f.corrected_by) j["corrected_by"] = *f.corrected_by;
  if (f.corrected_at) j["corrected_at"] = format_timestamp(*f.corrected_at);
  return j;
}

json curp_analysis_json(const bc::CurpAnalysis& a) {
  json j{{"valid", a.valid()},
         {"format_ok", a.format_ok},
         {"forbidden_word", a.forbidden_word},
         {"check_digit_ok", a.check_digit_ok}};
  j["birth_date"] = a.birth_date ? json(*a.birth_date) : json(nullptr);
  j["federal_entity"] = a.federal_entity ? json(std::string(*a.federal_entity)) : json(nullptr);
  j["sex"] = a.sex ? json(std::string(1, *a.sex)) : json(nullptr);
  return j;
}

json answer_json(const bc::OmrAnswer& a) {
  if (!a.marked && !a.expected) return a.correct;
  json j{{"correct", a.correct}};
  j["marked"] = a.marked ? json(std::string(1, *a.marked)) : json(nullptr);
  if (a.expected) j["expected"] = std::string(1, *a.expected);
  return j;
}

}  // namespace

std::string format_timestamp(bc::Timestamp t) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&secs, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", utc);
}

json to_json(const bc::ScanResult& scan) {
  json j{{"id", scan.id},
         {"filename", scan.filename},
         {"status", std::string(bc::to_string(scan.status))},
         {"upload_time", format_timestamp(scan.upload_time)}};
  if (scan.processed_time) j["processed_time"] = format_timestamp(*scan.processed_time);
  if (scan.error_message) j["error_message"] = *scan.error_message;

  if (scan.regions) {
    j["regions"] = {{"omr", box_json(scan.regions->omr)},
                    {"nombre", box_json(scan.regions->nombre)},
                    {"curp", box_json(scan.regions->curp)},
                    {"fallback_layout", scan.regions->fallback_layout}};
  }
  if (scan.omr) {
    json answers = json::array();
    for (const auto& a : scan.omr->answers) answers.push_back(answer_json(a));
    j["omr"] = {{"score", scan.omr->score}, {"total", scan.omr->total}, {"answers", answers}};
  }
  if (scan.nombre) j["nombre"] = field_json(*scan.nombre);
  if (scan.curp) {
    j["curp"] = field_json(*scan.curp);
    j["curp"]["analysis"] = curp_analysis_json(bc::analyze_curp(scan.curp->text));
  }
  if (scan.quality) j["quality"] = quality_json(*scan.quality);
  return j;
}

}  // namespace bubblegrade::app
