#ifndef SAMPLESPLIT_TEST_COUNT_AGGREGATOR_TEST_H
#define SAMPLESPLIT_TEST_COUNT_AGGREGATOR_TEST_H

#include "gtest/gtest.h"

class CountAggregatorTest : public ::testing::Test {
};

#endif // SAMPLESPLIT_TEST_COUNT_AGGREGATOR_TEST_H
