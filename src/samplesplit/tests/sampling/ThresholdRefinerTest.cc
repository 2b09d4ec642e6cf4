#include "core/SampleSplitAssert.h"
#include "sampling/ThresholdRefiner.h"
#include "tests/sampling/ThresholdRefinerTest.h"

static SetTally makeTally(uint64_t acceptedCount, const double* keys,
                          uint64_t numKeys) {
  SetTally tally;
  tally.acceptedCount = acceptedCount;
  tally.waitlistedKeys.assign(keys, keys + numKeys);
  return tally;
}

TEST_F(ThresholdRefinerTest, testSelectOrderStatistic) {
  const double values[] = {0.5, 0.1, 0.9, 0.3, 0.7};
  KeyVector keys(values, values + 5);

  EXPECT_EQ(0.1, ThresholdRefiner::selectOrderStatistic(keys, 1));
  EXPECT_EQ(0.5, ThresholdRefiner::selectOrderStatistic(keys, 3));
  EXPECT_EQ(0.9, ThresholdRefiner::selectOrderStatistic(keys, 5));

  ASSERT_THROW(ThresholdRefiner::selectOrderStatistic(keys, 0),
               AssertionFailedException);
  ASSERT_THROW(ThresholdRefiner::selectOrderStatistic(keys, 6),
               AssertionFailedException);
}

TEST_F(ThresholdRefinerTest, testTargetMetByAcceptedRecords) {
  const double keys[] = {0.21, 0.22};
  SetTally tally = makeTally(10, keys, 2);
  Threshold threshold(0.0, 0.2, 0.4);

  AdvisoryList advisories;
  double cutoff = ThresholdRefiner::refineCutoff(
    "A", threshold, 10, tally, advisories);

  EXPECT_EQ(0.2, cutoff);
  EXPECT_TRUE(advisories.empty());
}

TEST_F(ThresholdRefinerTest, testTargetExceeded) {
  const double keys[] = {0.21};
  SetTally tally = makeTally(12, keys, 1);
  Threshold threshold(0.0, 0.2, 0.4);

  AdvisoryList advisories;
  double cutoff = ThresholdRefiner::refineCutoff(
    "A", threshold, 10, tally, advisories);

  EXPECT_EQ(0.2, cutoff);
  ASSERT_EQ((uint64_t) 1, advisories.size());
  EXPECT_EQ(RefinementAdvisory::TARGET_EXCEEDED, advisories[0].kind);
  EXPECT_EQ(std::string("A"), advisories[0].setName);
  EXPECT_EQ((uint64_t) 10, advisories[0].target);
  EXPECT_EQ((uint64_t) 12, advisories[0].acceptedCount);
  EXPECT_EQ(std::string("TARGET_EXCEEDED"),
            std::string(advisories[0].kindName()));
}

TEST_F(ThresholdRefinerTest, testWholeWaitlistNeeded) {
  const double keys[] = {0.6, 0.55};
  SetTally tally = makeTally(18, keys, 2);
  Threshold threshold(0.0, 0.5, 0.7);

  AdvisoryList advisories;
  double cutoff = ThresholdRefiner::refineCutoff(
    "A", threshold, 20, tally, advisories);

  EXPECT_EQ(0.7, cutoff);
  EXPECT_TRUE(advisories.empty());
}

TEST_F(ThresholdRefinerTest, testWaitlistShort) {
  const double keys[] = {0.6};
  SetTally tally = makeTally(15, keys, 1);
  Threshold threshold(0.0, 0.5, 0.7);

  AdvisoryList advisories;
  double cutoff = ThresholdRefiner::refineCutoff(
    "A", threshold, 20, tally, advisories);

  EXPECT_EQ(0.7, cutoff);
  ASSERT_EQ((uint64_t) 1, advisories.size());
  EXPECT_EQ(RefinementAdvisory::WAITLIST_SHORT, advisories[0].kind);
  EXPECT_EQ((uint64_t) 1, advisories[0].waitlistLength);
  EXPECT_NE(std::string::npos, advisories[0].describe().find("'A'"));
}

TEST_F(ThresholdRefinerTest, testCutoffInsideWaitlist) {
  const double keys[] = {0.45, 0.41, 0.48, 0.43, 0.47, 0.42};
  SetTally tally = makeTally(7, keys, 6);
  Threshold threshold(0.0, 0.4, 0.5);

  AdvisoryList advisories;
  double cutoff = ThresholdRefiner::refineCutoff(
    "A", threshold, 10, tally, advisories);

  // 0.41, 0.42 and 0.43 fall below the cutoff; 0.45 itself doesn't.
  EXPECT_EQ(0.45, cutoff);
  EXPECT_TRUE(advisories.empty());
}

TEST_F(ThresholdRefinerTest, testRefineOffsetLayout) {
  SamplingPlan plan;
  plan.layout = OFFSET_LAYOUT;
  plan.sets.push_back(PlannedSet("train", 3, 3, Threshold(0.0, 0.1, 0.3)));
  plan.sets.push_back(PlannedSet("test", 2, 2, Threshold(0.3, 0.4, 0.6)));

  const double trainKeys[] = {0.25, 0.15, 0.2};
  const double testKeys[] = {0.5, 0.45};

  TallyMap globalTally;
  globalTally["train"] = makeTally(1, trainKeys, 3);
  globalTally["test"] = makeTally(1, testKeys, 2);

  ThresholdRefiner refiner;
  FinalThresholdList finals;
  AdvisoryList advisories;
  refiner.refine(plan, globalTally, finals, advisories);

  ASSERT_EQ((uint64_t) 2, finals.size());
  EXPECT_EQ(std::string("train"), finals[0].name);
  EXPECT_EQ(0.0, finals[0].threshold.low);
  EXPECT_EQ(0.25, finals[0].threshold.high);
  EXPECT_EQ(std::string("test"), finals[1].name);
  EXPECT_EQ(0.3, finals[1].threshold.low);
  EXPECT_EQ(0.5, finals[1].threshold.high);
  EXPECT_TRUE(advisories.empty());
}

TEST_F(ThresholdRefinerTest, testRefineNestedLayout) {
  SamplingPlan plan;
  plan.layout = NESTED_LAYOUT;
  plan.sets.push_back(PlannedSet("train", 10, 10, Threshold(0.0, 0.2, 0.4)));
  plan.sets.push_back(PlannedSet("test", 10, 20, Threshold(0.0, 0.5, 0.7)));

  const double trainKeys[] = {0.3, 0.25, 0.35};
  const double testKeys[] = {0.6, 0.55};

  TallyMap globalTally;
  globalTally["train"] = makeTally(8, trainKeys, 3);
  globalTally["test"] = makeTally(18, testKeys, 2);

  ThresholdRefiner refiner;
  FinalThresholdList finals;
  AdvisoryList advisories;
  refiner.refine(plan, globalTally, finals, advisories);

  ASSERT_EQ((uint64_t) 2, finals.size());
  EXPECT_EQ(0.0, finals[0].threshold.low);
  EXPECT_EQ(0.35, finals[0].threshold.high);
  EXPECT_EQ(0.35, finals[1].threshold.low);
  EXPECT_EQ(0.7, finals[1].threshold.high);
  EXPECT_TRUE(advisories.empty());
}

TEST_F(ThresholdRefinerTest, testNestedRangesNeverOverlap) {
  SamplingPlan plan;
  plan.layout = NESTED_LAYOUT;
  plan.sets.push_back(PlannedSet("first", 5, 5, Threshold(0.0, 0.3, 0.4)));
  plan.sets.push_back(PlannedSet("second", 0, 5, Threshold(0.0, 0.3, 0.4)));

  const double keys[] = {0.32, 0.31};

  TallyMap globalTally;
  globalTally["first"] = makeTally(4, keys, 2);
  globalTally["second"] = makeTally(4, keys, 2);

  ThresholdRefiner refiner;
  FinalThresholdList finals;
  AdvisoryList advisories;
  refiner.refine(plan, globalTally, finals, advisories);

  ASSERT_EQ((uint64_t) 2, finals.size());
  EXPECT_EQ(0.32, finals[0].threshold.high);
  EXPECT_EQ(0.32, finals[1].threshold.low);
  EXPECT_EQ(0.32, finals[1].threshold.high);
}

TEST_F(ThresholdRefinerTest, testMissingTallyEntry) {
  SamplingPlan plan;
  plan.sets.push_back(PlannedSet("A", 5, 5, Threshold(0.0, 0.1, 0.2)));

  TallyMap globalTally;

  ThresholdRefiner refiner;
  FinalThresholdList finals;
  AdvisoryList advisories;
  refiner.refine(plan, globalTally, finals, advisories);

  ASSERT_EQ((uint64_t) 1, finals.size());
  EXPECT_EQ(0.2, finals[0].threshold.high);
  ASSERT_EQ((uint64_t) 1, advisories.size());
  EXPECT_EQ(RefinementAdvisory::WAITLIST_SHORT, advisories[0].kind);
  EXPECT_EQ((uint64_t) 0, advisories[0].acceptedCount);
}
