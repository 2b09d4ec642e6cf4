#include <list>
#include <unistd.h>
#include <vector>

#include "core/SampleSplitAssert.h"
#include "core/Utils.h"
#include "tests/core/UtilsTest.h"

extern const char* TEST_WRITE_ROOT;

void UtilsTest::SetUp() {
  jsonFilename.assign(std::string(TEST_WRITE_ROOT) + "/utils_test.json");
}

void UtilsTest::TearDown() {
  if (fileExists(jsonFilename)) {
    unlink(jsonFilename.c_str());
  }
}

TEST_F(UtilsTest, testParseCommaDelimitedList) {
  StringList testList;
  std::string testString1 = "  ";

  parseCommaDelimitedList<std::string, StringList>(testList, testString1);

  EXPECT_EQ((uint64_t) 0, testList.size());

  std::string testString2 = "/data/a, /data/b,/data/c*,,/data/d,   ";

  parseCommaDelimitedList<std::string, StringList>(testList, testString2);

  ASSERT_EQ((uint64_t) 4, testList.size());

  StringList::iterator iter = testList.begin();
  EXPECT_EQ(std::string("/data/a"), *iter++);
  EXPECT_EQ(std::string("/data/b"), *iter++);
  EXPECT_EQ(std::string("/data/c*"), *iter++);
  EXPECT_EQ(std::string("/data/d"), *iter++);

  std::vector<uint64_t> testVector;

  parseCommaDelimitedList< uint64_t, std::vector<uint64_t> >(
    testVector, "42, 69, 8");

  ASSERT_EQ((uint64_t) 3, testVector.size());
  EXPECT_EQ((uint64_t) 42, testVector[0]);
  EXPECT_EQ((uint64_t) 69, testVector[1]);
  EXPECT_EQ((uint64_t) 8, testVector[2]);
}

TEST_F(UtilsTest, testStrip) {
  std::string str("  \ttrain \t");
  strip(str);
  EXPECT_EQ(std::string("train"), str);

  std::string whitespace(" \t ");
  strip(whitespace);
  EXPECT_EQ(std::string(""), whitespace);

  std::string empty;
  strip(empty);
  EXPECT_EQ(std::string(""), empty);
}

TEST_F(UtilsTest, testJsonFile) {
  Json::Value value(Json::objectValue);
  value["seed"] = Json::UInt64(42);
  value["sets"] = Json::Value(Json::arrayValue);
  value["sets"].append("train");
  value["sets"].append("test");

  writeJsonFile(jsonFilename, value);

  Json::Value loaded;
  loadJsonFile(jsonFilename, loaded);

  EXPECT_EQ((uint64_t) 42, loaded["seed"].asUInt64());
  ASSERT_EQ((uint32_t) 2, loaded["sets"].size());
  EXPECT_EQ(std::string("train"), loaded["sets"][0].asString());
  EXPECT_EQ(std::string("test"), loaded["sets"][1].asString());
}

TEST_F(UtilsTest, testLoadMalformedJson) {
  std::string malformed("{\"seed\": ");
  Json::Value value;

  ASSERT_THROW(loadJsonString(malformed.c_str(), malformed.size(), value),
               AssertionFailedException);
}
