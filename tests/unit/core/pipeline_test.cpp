#include <bubblegrade/core/pipeline.hpp>
#include <bubblegrade/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace bc = bubblegrade::core;

namespace {

class WriteRegionsStage : public bc::IScanStage {
 public:
  std::string_view name() const noexcept override { return "write_regions"; }
  std::expected<void, bc::ScanFailure> process(bc::ScanContext& context) override {
    context.regions = bc::RegionSet{};
    return {};
  }
};

class FailingStage : public bc::IScanStage {
 public:
  std::string_view name() const noexcept override { return "fail"; }
  std::expected<void, bc::ScanFailure> process(bc::ScanContext&) override {
    return std::unexpected(bc::make_failure(bc::PipelineError::ExtractionError, "boom"));
  }
};

class CountingStage : public bc::IScanStage {
 public:
  explicit CountingStage(int& calls) : calls_(calls) {}
  std::string_view name() const noexcept override { return "count"; }
  std::expected<void, bc::ScanFailure> process(bc::ScanContext&) override {
    ++calls_;
    return {};
  }

 private:
  int& calls_;
};

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  bc::Pipeline p;
  bc::ScanContext ctx;
  auto result = p.run(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, bc::PipelineError::InvalidConfig);
}

TEST(Pipeline, NullStageIsIgnored) {
  bc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, StagesRunInOrder) {
  int calls = 0;
  bc::Pipeline p;
  p.add_stage(std::make_unique<WriteRegionsStage>());
  p.add_stage(std::make_unique<CountingStage>(calls));
  bc::ScanContext ctx;
  ASSERT_TRUE(p.run(ctx).has_value());
  EXPECT_TRUE(ctx.regions.has_value());
  EXPECT_EQ(calls, 1);
}

TEST(Pipeline, StopsAtFirstFailureKeepingPartialResults) {
  int calls = 0;
  bc::Pipeline p;
  p.add_stage(std::make_unique<WriteRegionsStage>());
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<CountingStage>(calls));
  bc::ScanContext ctx;
  auto result = p.run(ctx);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, bc::PipelineError::ExtractionError);
  EXPECT_EQ(result.error().message, "boom");
  EXPECT_TRUE(ctx.regions.has_value());
  EXPECT_EQ(calls, 0);
}

TEST(Pipeline, TimingCallbackInvokedPerStage) {
  int calls = 0;
  bc::Pipeline p;
  p.add_stage(std::make_unique<CountingStage>(calls));
  p.add_stage(std::make_unique<CountingStage>(calls));
  std::vector<std::size_t> indices;
  bc::StageTimingCallback cb = [&](std::size_t i, double ms) {
    indices.push_back(i);
    EXPECT_GE(ms, 0.0);
  };
  bc::ScanContext ctx;
  ASSERT_TRUE(p.run(ctx, &cb).has_value());
  EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1}));
}
