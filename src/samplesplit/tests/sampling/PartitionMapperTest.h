#ifndef SAMPLESPLIT_TEST_PARTITION_MAPPER_TEST_H
#define SAMPLESPLIT_TEST_PARTITION_MAPPER_TEST_H

#include "gtest/gtest.h"

class PartitionMapperTest : public ::testing::Test {
};

#endif // SAMPLESPLIT_TEST_PARTITION_MAPPER_TEST_H
