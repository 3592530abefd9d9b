#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "gradebox/testcase/test_case.hpp"

namespace gradebox::testcase {
namespace {

// =============================================================================
// Array and single-object specifications
// =============================================================================

TEST(TestCaseParseTest, ArrayKeepsOrderAndFields) {
  auto cases = ParseTestCases(R"([
    {"input": "5 3\n", "expected_output": "Sum is 8\n", "description": "small"},
    {"input": "10 20\n", "expected_output": "Sum is 30\n", "description": "large"}
  ])");

  ASSERT_EQ(cases.size(), 2U);
  EXPECT_EQ(cases[0].input, "5 3\n");
  EXPECT_EQ(cases[0].expected_output, "Sum is 8\n");
  EXPECT_EQ(cases[0].description, "small");
  EXPECT_EQ(cases[1].description, "large");
}

TEST(TestCaseParseTest, MissingFieldsDefault) {
  auto cases = ParseTestCases(R"([{"input": "1"}, {}])");

  ASSERT_EQ(cases.size(), 2U);
  EXPECT_EQ(cases[0].input, "1");
  EXPECT_EQ(cases[0].expected_output, "");
  EXPECT_EQ(cases[0].description, "Test case 1");
  EXPECT_EQ(cases[1].input, "");
  EXPECT_EQ(cases[1].description, "Test case 2");
}

TEST(TestCaseParseTest, NullFieldsDefault) {
  auto cases = ParseTestCases(R"([{"input": null, "description": null}])");

  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0].input, "");
  EXPECT_EQ(cases[0].description, "Test case 1");
}

TEST(TestCaseParseTest, SingleObjectIsOneElementList) {
  auto cases = ParseTestCases(R"({"input": "", "expected_output": "hi"})");

  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0].expected_output, "hi");
  EXPECT_EQ(cases[0].description, "Test case");
}

TEST(TestCaseParseTest, AlreadyParsedJson) {
  nlohmann::json spec = nlohmann::json::array(
      {{{"input", "x"}, {"expected_output", "y"}, {"description", "d"}}});

  auto cases = ParseTestCasesFromJson(spec);

  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0], (TestCase{.input = "x", .expected_output = "y", .description = "d"}));
}

// =============================================================================
// Unusable specifications yield no cases
// =============================================================================

TEST(TestCaseParseTest, EmptyAndBlankSpecs) {
  EXPECT_TRUE(ParseTestCases("").empty());
  EXPECT_TRUE(ParseTestCases("  \n\t").empty());
  EXPECT_TRUE(ParseTestCases("[]").empty());
}

TEST(TestCaseParseTest, InvalidJsonYieldsNothing) {
  EXPECT_TRUE(ParseTestCases("[{\"input\": ").empty());
  EXPECT_TRUE(ParseTestCases("not json").empty());
}

TEST(TestCaseParseTest, MalformedStructureYieldsNothing) {
  // One bad element discards the whole specification
  EXPECT_TRUE(ParseTestCases(R"([{"input": "1"}, 42])").empty());
  EXPECT_TRUE(ParseTestCases(R"([{"input": 5}])").empty());
  EXPECT_TRUE(ParseTestCases(R"({"expected_output": ["a"]})").empty());
}

TEST(TestCaseParseTest, ScalarSpecIsIgnored) {
  EXPECT_TRUE(ParseTestCases("\"just a string\"").empty());
  EXPECT_TRUE(ParseTestCases("17").empty());
  EXPECT_TRUE(ParseTestCases("null").empty());
}

// =============================================================================
// Implicit case
// =============================================================================

TEST(TestCaseResolveTest, EmptyListGetsImplicitCase) {
  auto cases = ResolveTestCases({});

  ASSERT_EQ(cases.size(), 1U);
  EXPECT_EQ(cases[0].input, "");
  EXPECT_EQ(cases[0].expected_output, "");
  EXPECT_EQ(cases[0].description, "Basic execution test");
  EXPECT_EQ(cases[0], ImplicitTestCase());
}

TEST(TestCaseResolveTest, SuppliedCasesAreKept) {
  std::vector<TestCase> supplied = {
      {.input = "a", .expected_output = "b", .description = "one"}};

  auto cases = ResolveTestCases(supplied);

  EXPECT_EQ(cases, supplied);
}

}  // namespace
}  // namespace gradebox::testcase
