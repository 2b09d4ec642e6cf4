#include <limits>
#include <math.h>

#include "sampling/SamplingErrors.h"
#include "sampling/ThresholdCalculator.h"
#include "tests/sampling/ThresholdCalculatorTest.h"

TEST_F(ThresholdCalculatorTest, testSingleSetBounds) {
  ThresholdCalculator calculator(5e-5, OFFSET_LAYOUT);

  TargetSetSizeList sizes;
  sizes.push_back(TargetSetSize("A", 100));

  SamplingPlan plan;
  calculator.computePlan(sizes, 1000, plan);

  double n = 1000.0;
  double p = 0.1;
  double gamma1 = -log(5e-5) / n;
  double gamma2 = -(2 * log(5e-5)) / (3 * n);
  double expectedAccept = p + gamma2 - sqrt(gamma2 * gamma2 + 3 * gamma2 * p);
  double expectedCutoff = p + gamma1 + sqrt(gamma1 * gamma1 + 2 * gamma1 * p);

  ASSERT_EQ((uint64_t) 1, plan.sets.size());
  const PlannedSet& set = plan.sets[0];

  EXPECT_EQ(std::string("A"), set.name);
  EXPECT_EQ((uint64_t) 100, set.targetSize);
  EXPECT_EQ((uint64_t) 100, set.refinementTarget);
  EXPECT_EQ(0.0, set.threshold.low);
  EXPECT_DOUBLE_EQ(expectedAccept, set.threshold.accept);
  EXPECT_DOUBLE_EQ(expectedCutoff, set.threshold.waitlistCutoff);

  EXPECT_NEAR(0.0616102, set.threshold.accept, 1e-6);
  EXPECT_NEAR(0.1554971, set.threshold.waitlistCutoff, 1e-6);

  EXPECT_EQ(OFFSET_LAYOUT, plan.layout);
  EXPECT_EQ((uint64_t) 1000, plan.population);
  EXPECT_EQ(5e-5, plan.delta);
}

TEST_F(ThresholdCalculatorTest, testBoundsAreClamped) {
  ThresholdCalculator calculator(5e-5, OFFSET_LAYOUT);

  double acceptRatio = -1.0;
  double waitlistRatio = -1.0;

  calculator.computeBounds(0, 1000, acceptRatio, waitlistRatio);
  EXPECT_EQ(0.0, acceptRatio);
  EXPECT_GT(waitlistRatio, 0.0);

  calculator.computeBounds(1000, 1000, acceptRatio, waitlistRatio);
  EXPECT_LT(acceptRatio, 1.0);
  EXPECT_EQ(1.0, waitlistRatio);
}

TEST_F(ThresholdCalculatorTest, testSmallerDeltaWidensWaitlist) {
  ThresholdCalculator loose(1e-2, OFFSET_LAYOUT);
  ThresholdCalculator tight(1e-8, OFFSET_LAYOUT);

  double looseAccept, looseCutoff, tightAccept, tightCutoff;
  loose.computeBounds(100, 1000, looseAccept, looseCutoff);
  tight.computeBounds(100, 1000, tightAccept, tightCutoff);

  EXPECT_LT(tightAccept, looseAccept);
  EXPECT_GT(tightCutoff, looseCutoff);
  EXPECT_LT(looseAccept, 0.1);
  EXPECT_GT(looseCutoff, 0.1);
}

TEST_F(ThresholdCalculatorTest, testOffsetLayout) {
  ThresholdCalculator calculator(5e-5, OFFSET_LAYOUT);

  TargetSetSizeList sizes;
  sizes.push_back(TargetSetSize("a", 2000));
  sizes.push_back(TargetSetSize("b", 3000));
  sizes.push_back(TargetSetSize("c", 1000));

  SamplingPlan plan;
  calculator.computePlan(sizes, 10000, plan);

  ASSERT_EQ((uint64_t) 3, plan.sets.size());

  EXPECT_EQ(0.0, plan.sets[0].threshold.low);

  // Each set starts where the previous set's waitlist ends.
  for (uint64_t i = 1; i < plan.sets.size(); i++) {
    EXPECT_EQ(plan.sets[i - 1].threshold.waitlistCutoff,
              plan.sets[i].threshold.low);
    EXPECT_EQ(plan.sets[i].targetSize, plan.sets[i].refinementTarget);
  }

  // Widths match the single-set bounds.
  double acceptRatio, waitlistRatio;
  calculator.computeBounds(3000, 10000, acceptRatio, waitlistRatio);
  EXPECT_DOUBLE_EQ(plan.sets[1].threshold.low + acceptRatio,
                   plan.sets[1].threshold.accept);
  EXPECT_DOUBLE_EQ(plan.sets[1].threshold.low + waitlistRatio,
                   plan.sets[1].threshold.waitlistCutoff);

  EXPECT_LE(plan.sets[2].threshold.waitlistCutoff, 1.0);
}

TEST_F(ThresholdCalculatorTest, testCapacityExceeded) {
  ThresholdCalculator calculator(5e-5, OFFSET_LAYOUT);

  TargetSetSizeList sizes;
  sizes.push_back(TargetSetSize("a", 500));
  sizes.push_back(TargetSetSize("b", 450));

  SamplingPlan plan;
  ASSERT_THROW(calculator.computePlan(sizes, 1000, plan),
               CapacityExceededException);
}

TEST_F(ThresholdCalculatorTest, testNestedLayout) {
  ThresholdCalculator calculator(5e-5, NESTED_LAYOUT);

  TargetSetSizeList sizes;
  sizes.push_back(TargetSetSize("train", 545));
  sizes.push_back(TargetSetSize("test", 454));

  SamplingPlan plan;
  calculator.computePlan(sizes, 1000, plan);

  ASSERT_EQ((uint64_t) 2, plan.sets.size());
  EXPECT_EQ(NESTED_LAYOUT, plan.layout);

  EXPECT_EQ((uint64_t) 545, plan.sets[0].targetSize);
  EXPECT_EQ((uint64_t) 545, plan.sets[0].refinementTarget);
  EXPECT_EQ((uint64_t) 454, plan.sets[1].targetSize);
  EXPECT_EQ((uint64_t) 999, plan.sets[1].refinementTarget);

  double acceptRatio, waitlistRatio;
  calculator.computeBounds(999, 1000, acceptRatio, waitlistRatio);

  EXPECT_EQ(0.0, plan.sets[1].threshold.low);
  EXPECT_DOUBLE_EQ(acceptRatio, plan.sets[1].threshold.accept);
  EXPECT_EQ(1.0, plan.sets[1].threshold.waitlistCutoff);

  EXPECT_LT(plan.sets[0].threshold.accept, plan.sets[1].threshold.accept);
}

TEST_F(ThresholdCalculatorTest, testAutoLayout) {
  ThresholdCalculator calculator(5e-5, AUTO_LAYOUT);

  TargetSetSizeList fitting;
  fitting.push_back(TargetSetSize("train", 300));
  fitting.push_back(TargetSetSize("test", 200));

  SamplingPlan offsetPlan;
  calculator.computePlan(fitting, 1000, offsetPlan);

  EXPECT_EQ(OFFSET_LAYOUT, offsetPlan.layout);
  EXPECT_EQ(offsetPlan.sets[0].threshold.waitlistCutoff,
            offsetPlan.sets[1].threshold.low);

  TargetSetSizeList overflowing;
  overflowing.push_back(TargetSetSize("train", 545));
  overflowing.push_back(TargetSetSize("test", 454));

  SamplingPlan nestedPlan;
  calculator.computePlan(overflowing, 1000, nestedPlan);

  EXPECT_EQ(NESTED_LAYOUT, nestedPlan.layout);
  EXPECT_EQ((uint64_t) 999, nestedPlan.sets[1].refinementTarget);
  EXPECT_EQ(0.0, nestedPlan.sets[1].threshold.low);
}

TEST_F(ThresholdCalculatorTest, testInvalidDelta) {
  ASSERT_THROW(ThresholdCalculator(0.0, OFFSET_LAYOUT),
               InvalidConfigurationException);
  ASSERT_THROW(ThresholdCalculator(1.0, OFFSET_LAYOUT),
               InvalidConfigurationException);
  ASSERT_THROW(ThresholdCalculator(-0.5, OFFSET_LAYOUT),
               InvalidConfigurationException);
  ASSERT_THROW(
    ThresholdCalculator(std::numeric_limits<double>::quiet_NaN(),
                        OFFSET_LAYOUT),
    InvalidConfigurationException);
}

TEST_F(ThresholdCalculatorTest, testParseLayout) {
  EXPECT_EQ(OFFSET_LAYOUT, parseKeyspaceLayout("offset"));
  EXPECT_EQ(NESTED_LAYOUT, parseKeyspaceLayout("nested"));
  EXPECT_EQ(AUTO_LAYOUT, parseKeyspaceLayout("auto"));
  EXPECT_EQ(std::string("nested"),
            std::string(keyspaceLayoutName(NESTED_LAYOUT)));
  ASSERT_THROW(parseKeyspaceLayout("interleaved"),
               InvalidConfigurationException);
}
