#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "ephem_core/errors.hpp"
#include "ephem_core/vector/vector_index.hpp"
#include "utilities_test.hpp"

namespace ephem_tests {

using namespace ephem_core;

class VectorIndexTest : public ::testing::Test {
 protected:
  VectorIndex index_{2};
};

TEST_F(VectorIndexTest, QueryWithStoredVectorScoresOne) {
  index_.append({{3.0f, 4.0f}, {0.0f, 2.0f}}, 0);

  auto results = index_.query({0.6f, 0.8f}, 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].index, 0u);
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
}

TEST_F(VectorIndexTest, OrthogonalScenarioRanksByCosine) {
  index_.append({{1.0f, 0.0f}, {0.0f, 1.0f}}, 0);

  auto first = index_.query({0.9f, 0.1f}, 1);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].index, 0u);
  EXPECT_NEAR(first[0].score, 0.9f / std::sqrt(0.82f), 1e-5);

  auto both = index_.query({0.1f, 0.9f}, 2);
  ASSERT_EQ(both.size(), 2u);
  EXPECT_EQ(both[0].index, 1u);
  EXPECT_EQ(both[1].index, 0u);
  EXPECT_GT(both[0].score, both[1].score);
}

TEST_F(VectorIndexTest, KLargerThanSizeIsClamped) {
  index_.append({{1.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 1.0f}}, 0);

  EXPECT_EQ(index_.query({1.0f, 0.0f}, 50).size(), 3u);
}

TEST_F(VectorIndexTest, EmptyIndexReturnsNothing) {
  EXPECT_TRUE(index_.query({1.0f, 0.0f}, 5).empty());
}

TEST_F(VectorIndexTest, TiesGoToLowerInsertionIndex) {
  index_.append({{0.0f, 1.0f}, {2.0f, 0.0f}, {1.0f, 0.0f}, {4.0f, 0.0f}}, 0);

  auto results = index_.query({1.0f, 0.0f}, 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].index, 1u);
  EXPECT_EQ(results[1].index, 2u);
  EXPECT_EQ(results[2].index, 3u);
}

TEST_F(VectorIndexTest, RepeatedQueriesReturnIdenticalOrdering) {
  VectorIndex index(4);
  index.append(TestUtilities::distinct_vectors(12, 4), 0);
  const std::vector<float> query = {0.3f, 0.2f, 0.4f, 0.1f};

  auto baseline = index.query(query, 12);
  for (int run = 0; run < 20; ++run) {
    auto again = index.query(query, 12);
    ASSERT_EQ(again.size(), baseline.size());
    for (size_t i = 0; i < again.size(); ++i) {
      EXPECT_EQ(again[i].index, baseline[i].index);
      EXPECT_FLOAT_EQ(again[i].score, baseline[i].score);
    }
  }
}

TEST_F(VectorIndexTest, ZeroNormRowRejectsWholeBatch) {
  EXPECT_THROW(index_.append({{1.0f, 0.0f}, {0.0f, 0.0f}}, 0), InvalidArgumentError);
  EXPECT_EQ(index_.size(), 0u);
}

TEST_F(VectorIndexTest, NonFiniteRowRejected) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  EXPECT_THROW(index_.append({{nan, 1.0f}}, 0), InvalidArgumentError);
  EXPECT_THROW(index_.append({{inf, 1.0f}}, 0), InvalidArgumentError);
  EXPECT_EQ(index_.size(), 0u);
}

TEST_F(VectorIndexTest, WrongDimensionRejected) {
  EXPECT_THROW(index_.append({{1.0f, 0.0f, 0.0f}}, 0), DimensionMismatchError);
  index_.append({{1.0f, 0.0f}}, 0);
  EXPECT_THROW(index_.query({1.0f}, 1), DimensionMismatchError);
}

TEST_F(VectorIndexTest, ZeroQueryRejected) {
  index_.append({{1.0f, 0.0f}}, 0);
  EXPECT_THROW(index_.query({0.0f, 0.0f}, 1), InvalidArgumentError);
}

TEST_F(VectorIndexTest, StartIndexMustMatchSize) {
  index_.append({{1.0f, 0.0f}}, 0);
  EXPECT_THROW(index_.append({{0.0f, 1.0f}}, 0), CorruptedIndexError);
  EXPECT_THROW(index_.append({{0.0f, 1.0f}}, 5), CorruptedIndexError);
  EXPECT_EQ(index_.size(), 1u);
  index_.append({{0.0f, 1.0f}}, 1);
  EXPECT_EQ(index_.size(), 2u);
}

TEST_F(VectorIndexTest, StoredVectorsAreUnitLength) {
  index_.append({{3.0f, 4.0f}}, 0);

  std::vector<float> stored = index_.vector_at(0);

  ASSERT_EQ(stored.size(), 2u);
  EXPECT_NEAR(stored[0], 0.6f, 1e-6);
  EXPECT_NEAR(stored[1], 0.8f, 1e-6);
  EXPECT_THROW(index_.vector_at(1), InvalidArgumentError);
}

TEST(VectorIndexConstruction, ZeroDimensionRejected) {
  EXPECT_THROW(VectorIndex index(0), InvalidArgumentError);
}

}  // namespace ephem_tests
