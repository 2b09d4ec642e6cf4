#ifndef SAMPLESPLIT_TEST_THRESHOLD_REFINER_TEST_H
#define SAMPLESPLIT_TEST_THRESHOLD_REFINER_TEST_H

#include "gtest/gtest.h"

class ThresholdRefinerTest : public ::testing::Test {
};

#endif // SAMPLESPLIT_TEST_THRESHOLD_REFINER_TEST_H
