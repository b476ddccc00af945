#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

#include "ephem_core/errors.hpp"
#include "utilities_test.hpp"

namespace ephem_tests {

using namespace ephem_core;

// Two-dimensional store so vectors can be written out by hand
class RetrievalServiceTest : public ServiceTestBase {
 protected:
  CoreSettings settings() const override {
    return TestUtilities::small_settings(2);
  }

  void ingest_two_axes(const std::string &session_id = "S") {
    std::vector<ChunkInput> chunks = {
        TestUtilities::make_chunk_with_vector("about x", {1.0f, 0.0f}),
        TestUtilities::make_chunk_with_vector("about y", {0.0f, 1.0f}, ContentKind::Table),
    };
    harness_->ingestion->ingest(request_for("alice", chunks, session_id));
  }

  RetrieveRequest query(const std::string &text, int k, const std::string &session_id = "S") {
    RetrieveRequest request;
    request.session_id = session_id;
    request.query_text = text;
    request.k = k;
    return request;
  }
};

TEST_F(RetrievalServiceTest, NearXQueryReturnsFirstChunk) {
  ingest_two_axes();
  harness_->provider->set("mostly x", {0.9f, 0.1f});

  RetrieveResponse response = harness_->retrieval->retrieve(query("mostly x", 1));

  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].chunk_index, 0u);
  EXPECT_EQ(response.results[0].text, "about x");
  EXPECT_NEAR(response.results[0].score, 0.9f / std::sqrt(0.82f), 1e-5);
  EXPECT_GE(response.took_ms, 0);
}

TEST_F(RetrievalServiceTest, NearYQueryRanksSecondChunkFirst) {
  ingest_two_axes();
  harness_->provider->set("mostly y", {0.1f, 0.9f});

  RetrieveResponse response = harness_->retrieval->retrieve(query("mostly y", 2));

  ASSERT_EQ(response.results.size(), 2u);
  EXPECT_EQ(response.results[0].chunk_index, 1u);
  EXPECT_EQ(response.results[0].text, "about y");
  EXPECT_EQ(response.results[0].metadata.kind, ContentKind::Table);
  EXPECT_EQ(response.results[1].chunk_index, 0u);
  EXPECT_GT(response.results[0].score, response.results[1].score);
}

TEST_F(RetrievalServiceTest, ExactStoredVectorScoresOne) {
  ingest_two_axes();
  harness_->provider->set("x", {1.0f, 0.0f});

  RetrieveResponse response = harness_->retrieval->retrieve(query("x", 1));

  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].chunk_index, 0u);
  EXPECT_NEAR(response.results[0].score, 1.0f, 1e-5);
}

TEST_F(RetrievalServiceTest, KAboveStoredCountReturnsEverything) {
  ingest_two_axes();
  harness_->provider->set("q", {0.5f, 0.5f});

  EXPECT_EQ(harness_->retrieval->retrieve(query("q", 10)).results.size(), 2u);
}

TEST_F(RetrievalServiceTest, RepeatedQueriesRankIdentically) {
  std::vector<ChunkInput> chunks;
  for (int i = 0; i < 8; ++i) {
    float angle = 0.2f * static_cast<float>(i);
    chunks.push_back(TestUtilities::make_chunk_with_vector("c" + std::to_string(i),
                                                           {std::cos(angle), std::sin(angle)}));
  }
  harness_->ingestion->ingest(request_for("alice", chunks, "S"));
  harness_->provider->set("q", {0.7f, 0.3f});

  RetrieveResponse baseline = harness_->retrieval->retrieve(query("q", 8));
  for (int run = 0; run < 10; ++run) {
    RetrieveResponse again = harness_->retrieval->retrieve(query("q", 8));
    ASSERT_EQ(again.results.size(), baseline.results.size());
    for (size_t i = 0; i < again.results.size(); ++i) {
      EXPECT_EQ(again.results[i].chunk_index, baseline.results[i].chunk_index);
    }
  }
}

TEST_F(RetrievalServiceTest, NonPositiveOrOversizedKIsInvalid) {
  ingest_two_axes();
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 0)), InvalidArgumentError);
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", -3)), InvalidArgumentError);
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 11)), InvalidArgumentError);
  EXPECT_THROW(harness_->retrieval->retrieve(query("", 1)), InvalidArgumentError);
  EXPECT_EQ(harness_->provider->calls(), 0);
}

TEST_F(RetrievalServiceTest, MissingOrExpiredSessionFailsBeforeEmbedding) {
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 1, "nope")), SessionNotFoundError);

  ingest_two_axes();
  harness_->clock.advance(std::chrono::seconds(61));
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 1)), SessionExpiredError);

  harness_->store->sweep_expired();
  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 1)), SessionNotFoundError);
  EXPECT_EQ(harness_->provider->calls(), 0);
}

TEST_F(RetrievalServiceTest, QueryRefreshesSessionLifetime) {
  ingest_two_axes();
  harness_->provider->set("q", {1.0f, 1.0f});

  harness_->clock.advance(std::chrono::seconds(50));
  harness_->retrieval->retrieve(query("q", 1));
  harness_->clock.advance(std::chrono::seconds(50));

  EXPECT_NO_THROW(harness_->retrieval->retrieve(query("q", 1)));
}

TEST_F(RetrievalServiceTest, SwappedEmbeddingModelIsDimensionMismatch) {
  ingest_two_axes();
  harness_->provider->override_dimension(3);

  EXPECT_THROW(harness_->retrieval->retrieve(query("q", 1)), DimensionMismatchError);
}

TEST_F(RetrievalServiceTest, KindFilterReturnsOnlyThatKind) {
  ingest_two_axes();
  harness_->provider->set("mostly x", {0.9f, 0.1f});

  RetrieveRequest request = query("mostly x", 1);
  request.kind_filter = ContentKind::Table;
  RetrieveResponse response = harness_->retrieval->retrieve(request);

  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].text, "about y");

  request.kind_filter = ContentKind::Figure;
  EXPECT_TRUE(harness_->retrieval->retrieve(request).results.empty());
}

TEST_F(RetrievalServiceTest, SessionsDoNotSeeEachOther) {
  ingest_two_axes("A");
  std::vector<ChunkInput> other = {TestUtilities::make_chunk_with_vector("other", {1.0f, 0.0f})};
  harness_->ingestion->ingest(request_for("bob", other, "B"));
  harness_->provider->set("x", {1.0f, 0.0f});

  RetrieveResponse a = harness_->retrieval->retrieve(query("x", 5, "A"));
  RetrieveResponse b = harness_->retrieval->retrieve(query("x", 5, "B"));

  EXPECT_EQ(a.results.size(), 2u);
  ASSERT_EQ(b.results.size(), 1u);
  EXPECT_EQ(b.results[0].text, "other");
}

TEST_F(RetrievalServiceTest, ReadDuringConcurrentIngestionSeesWholeBatches) {
  ingest_two_axes();
  harness_->provider->set("q", {0.6f, 0.8f});
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread writer([this, &done] {
    for (int i = 0; i < 20; ++i) {
      std::vector<ChunkInput> batch = {
          TestUtilities::make_chunk_with_vector("w1", {1.0f, 0.5f}),
          TestUtilities::make_chunk_with_vector("w2", {0.5f, 1.0f}),
      };
      harness_->ingestion->ingest(request_for("alice", batch, "S"));
    }
    done = true;
  });
  while (!done) {
    size_t n = harness_->retrieval->retrieve(query("q", 10)).results.size();
    // Reads are capped at k=10; below that, batches of two keep the count even
    if (n < 10 && n % 2 != 0) {
      ++torn;
    }
  }
  writer.join();

  EXPECT_EQ(torn.load(), 0);
}

}  // namespace ephem_tests
