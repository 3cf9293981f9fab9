#include <bubblegrade/app/config.hpp>
#include <bubblegrade/app/scan_json.hpp>
#include <bubblegrade/app/service_context.hpp>
#include <bubblegrade/vision/field_extractor.hpp>
#include <bubblegrade/vision/local_grading_backend.hpp>
#include <bubblegrade/vision/mock_ocr_engine.hpp>
#include <bubblegrade/vision/omr_grader.hpp>
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace {

using namespace bubblegrade::core;
using namespace bubblegrade::vision;
using namespace bubblegrade::app;
namespace bt = bubblegrade::test;

/// Answer sheet: page outline with five rows of four bubbles in the lower part;
/// row r has choice (r % 4) filled.
cv::Mat answer_sheet() {
  cv::Mat img = bt::page_with_outline(600, 800, cv::Rect(20, 20, 560, 760));
  for (int r = 0; r < 5; ++r) {
    for (int c = 0; c < 4; ++c) {
      const cv::Point center(120 + c * 80, 340 + r * 80);
      cv::circle(img, center, 15, cv::Scalar(0, 0, 0), c == r % 4 ? cv::FILLED : 3);
    }
  }
  return img;
}

struct LocalService {
  std::unique_ptr<ServiceContext> service;
  MockOcrEngine* ocr{nullptr};
};

LocalService make_local_service(AppConfig config) {
  auto engine = std::make_unique<MockOcrEngine>();
  auto* ocr = engine.get();
  OmrGrader grader(OmrParams{}, config.answer_key);
  FieldExtractor extractor(std::move(engine), config.extractor);
  auto backend = std::make_unique<LocalGradingBackend>(std::move(grader), std::move(extractor));
  return {make_service_context(config, std::move(backend)), ocr};
}

}  // namespace

TEST(FullPipeline, GradesSheetEndToEnd) {
  auto [service, ocr] = make_local_service(default_config());
  ocr->push_output({"JUAN PEREZ", {{"JUAN", 86.f}, {"PEREZ", 84.f}}});
  ocr->push_output({"GODE561231HDFRRN06", {{"GODE561231HDFRRN06", 95.f}}});

  const auto bytes = bt::encode(answer_sheet(), ".jpg");
  auto scan = service->processor->process(bytes, "answer_sheet.jpg");
  ASSERT_TRUE(scan.has_value()) << scan.error().message;

  ASSERT_TRUE(scan->regions.has_value());
  EXPECT_FALSE(scan->regions->fallback_layout);
  ASSERT_TRUE(scan->omr.has_value());
  EXPECT_GT(scan->omr->total, 0);
  EXPECT_EQ(scan->nombre->text, "JUAN PEREZ");
  EXPECT_FLOAT_EQ(scan->nombre->confidence, 0.85f);
  EXPECT_EQ(scan->curp->text, "GODE561231HDFRRN06");
  EXPECT_EQ(scan->status, ScanStatus::Completed);
  EXPECT_EQ(ocr->call_count(), 2u);

  const auto j = to_json(*scan);
  EXPECT_EQ(j["status"], "COMPLETED");
  EXPECT_EQ(j["curp"]["analysis"]["federal_entity"], "CIUDAD DE MEXICO");
}

TEST(FullPipeline, AnswerKeyGrading) {
  AppConfig config = default_config();
  config.answer_key = {'A', 'B', 'C', 'A', 'D'};  // rows mark A, B, C, D, A
  config.parallel_grading = false;
  auto [service, ocr] = make_local_service(config);
  ocr->set_default_output({"ANA LOPEZ", {{"ANA", 90.f}, {"LOPEZ", 90.f}}});

  const auto bytes = bt::encode(answer_sheet());
  auto scan = service->processor->process(bytes, "answer_sheet.png");
  ASSERT_TRUE(scan.has_value()) << scan.error().message;
  ASSERT_TRUE(scan->omr.has_value());
  EXPECT_EQ(scan->omr->total, 5);
  EXPECT_EQ(scan->omr->score, 3);
  // curp text from the default output does not match the pattern.
  EXPECT_FLOAT_EQ(scan->curp->confidence, 0.f);
  EXPECT_EQ(scan->status, ScanStatus::NeedsReview);
}

TEST(FullPipeline, UnreadableCurpThenCorrection) {
  auto [service, ocr] = make_local_service(default_config());
  ocr->push_output({"JUAN PEREZ", {{"JUAN", 95.f}, {"PEREZ", 95.f}}});
  ocr->push_output({"G0DE56I23IHDFRRN06", {{"G0DE56I23IHDFRRN06", 97.f}}});

  const auto bytes = bt::encode(answer_sheet());
  auto scan = service->processor->process(bytes, "sheet.png");
  ASSERT_TRUE(scan.has_value());
  EXPECT_EQ(scan->status, ScanStatus::NeedsReview);
  EXPECT_TRUE(scan->curp->needs_review);

  FieldCorrection fix;
  fix.field = FieldKind::Curp;
  fix.text = "GODE561231HDFRRN06";
  fix.corrected_by = "maestra";
  auto corrected = service->processor->correct(scan->id, fix);
  ASSERT_TRUE(corrected.has_value()) << corrected.error().message;
  EXPECT_EQ(corrected->status, ScanStatus::Completed);
  EXPECT_EQ(corrected->curp->corrected_by, "maestra");
}

TEST(FullPipeline, CorruptUploadIsRecordedAsError) {
  auto [service, ocr] = make_local_service(default_config());
  auto bytes = bt::encode(answer_sheet(), ".jpg");
  bytes.resize(40);  // truncated header

  auto scan = service->processor->process(bytes, "broken.jpg");
  ASSERT_FALSE(scan.has_value());
  EXPECT_EQ(scan.error().code, PipelineError::DecodeError);
  auto stored = service->processor->get(scan.error().scan_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, ScanStatus::Error);
  EXPECT_FALSE(stored->regions.has_value());
  EXPECT_EQ(ocr->call_count(), 0u);
}
