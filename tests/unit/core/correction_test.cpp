#include <bubblegrade/core/correction.hpp>
#include <bubblegrade/core/result_merger.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

namespace bc = bubblegrade::core;

namespace {

/// Record that merged with both fields below threshold.
bc::ScanResult needs_review_scan() {
  auto scan = bc::make_queued_scan("sheet.jpg", std::chrono::system_clock::now());
  bc::OmrResult omr;
  omr.score = 5;
  omr.total = 5;
  bc::merge_scan_results(scan, omr, bc::make_field_result(bc::FieldKind::Nombre, "JAUN", 0.4f),
                         bc::make_field_result(bc::FieldKind::Curp, "G0DE", 0.3f), {},
                         std::chrono::system_clock::now());
  return scan;
}

bc::FieldCorrection fix(bc::FieldKind field, std::string text) {
  bc::FieldCorrection c;
  c.field = field;
  c.text = std::move(text);
  c.corrected_by = "reviewer@school";
  return c;
}

}  // namespace

TEST(Correction, NombreOnlyStaysInReview) {
  auto scan = needs_review_scan();
  ASSERT_EQ(scan.status, bc::ScanStatus::NeedsReview);

  const auto now = std::chrono::system_clock::now();
  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Nombre, "JUAN"), now));
  EXPECT_EQ(scan.status, bc::ScanStatus::NeedsReview);
  EXPECT_EQ(scan.nombre->text, "JUAN");
  EXPECT_FALSE(scan.nombre->needs_review);
  EXPECT_EQ(scan.nombre->corrected_by, "reviewer@school");
  EXPECT_EQ(scan.nombre->corrected_at, now);
  EXPECT_FLOAT_EQ(scan.nombre->confidence, 0.4f);
}

TEST(Correction, CurpMustMatchPattern) {
  auto scan = needs_review_scan();
  auto result = bc::apply_correction(scan, fix(bc::FieldKind::Curp, "NOTACURP"),
                                     std::chrono::system_clock::now());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, bc::PipelineError::InvalidCorrection);
  EXPECT_EQ(scan.curp->text, "G0DE");
}

TEST(Correction, FullSequence) {
  auto scan = needs_review_scan();
  const auto now = std::chrono::system_clock::now();
  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Nombre, "JUAN PEREZ"), now));
  EXPECT_EQ(scan.status, bc::ScanStatus::NeedsReview);
  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Curp, "GODE 561231 HDFRRN06"), now));
  EXPECT_EQ(scan.status, bc::ScanStatus::Completed);
  EXPECT_EQ(scan.curp->text, "GODE561231HDFRRN06");
}

TEST(Correction, ExplicitConfidenceIsClamped) {
  auto scan = needs_review_scan();
  auto c = fix(bc::FieldKind::Nombre, "JUAN");
  c.confidence = 3.f;
  ASSERT_TRUE(bc::apply_correction(scan, c, std::chrono::system_clock::now()));
  EXPECT_FLOAT_EQ(scan.nombre->confidence, 1.f);
}

TEST(Correction, RejectedOutsideReviewableStates) {
  for (auto status : {bc::ScanStatus::Queued, bc::ScanStatus::Processing, bc::ScanStatus::Error}) {
    auto scan = needs_review_scan();
    scan.status = status;
    auto result = bc::apply_correction(scan, fix(bc::FieldKind::Nombre, "JUAN"),
                                       std::chrono::system_clock::now());
    ASSERT_FALSE(result) << bc::to_string(status);
    EXPECT_EQ(result.error().code, bc::PipelineError::InvalidTransition);
  }
}

TEST(Correction, CompletedRecordCannotBeReopened) {
  auto scan = needs_review_scan();
  const auto now = std::chrono::system_clock::now();
  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Nombre, "JUAN"), now));
  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Curp, "GODE561231HDFRRN06"), now));
  ASSERT_EQ(scan.status, bc::ScanStatus::Completed);

  auto reopen = fix(bc::FieldKind::Nombre, "JUANA");
  reopen.needs_review = true;
  auto result = bc::apply_correction(scan, reopen, now);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, bc::PipelineError::InvalidTransition);

  ASSERT_TRUE(bc::apply_correction(scan, fix(bc::FieldKind::Nombre, "JUANA"), now));
  EXPECT_EQ(scan.status, bc::ScanStatus::Completed);
  EXPECT_EQ(scan.nombre->text, "JUANA");
}

TEST(Correction, BatchIsAllOrNothing) {
  auto scan = needs_review_scan();
  const std::vector<bc::FieldCorrection> batch{fix(bc::FieldKind::Nombre, "JUAN"),
                                               fix(bc::FieldKind::Curp, "BAD")};
  auto result = bc::apply_corrections(scan, batch, std::chrono::system_clock::now());
  ASSERT_FALSE(result);
  EXPECT_EQ(scan.nombre->text, "JAUN");
  EXPECT_EQ(scan.status, bc::ScanStatus::NeedsReview);
}
