#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <regex>
#include <tabclust_core/session.hpp>
#include <tabclust_core/tabclust.hpp>
#include <thread>
#include <vector>

using namespace tabclust;

// =============================================================================
// SECTION 1: Session
// =============================================================================

TEST(ClusteringSessionTest, IssuesSequentialIds) {
  ClusteringSession session("2024-05-01T12:30:00.123456");

  auto first = session.new_cluster({"a", "b"});
  auto second = session.new_cluster({"c"});

  EXPECT_EQ(first.id, "cluster_0");
  EXPECT_EQ(first.name, "Cluster 0");
  EXPECT_EQ(second.id, "cluster_1");
  EXPECT_EQ(second.name, "Cluster 1");
  EXPECT_EQ(session.clusters_issued(), 2);

  EXPECT_EQ(first.created_at, "2024-05-01T12:30:00.123456");
  EXPECT_EQ(first.meta<std::string>("created_at"), "2024-05-01T12:30:00.123456");
  EXPECT_EQ(first.meta<std::int64_t>("size"), 2);
  EXPECT_EQ(second.meta<std::int64_t>("size"), 1);
}

TEST(ClusteringSessionTest, SessionsAreIndependent) {
  ClusteringSession one;
  ClusteringSession two;
  (void)one.new_cluster({"a"});
  (void)one.new_cluster({"b"});

  EXPECT_EQ(two.new_cluster({"c"}).id, "cluster_0");
  EXPECT_TRUE(two.centroids().empty());
}

TEST(ClusteringSessionTest, CentroidTable) {
  ClusteringSession session;
  session.store_centroid("cluster_0", {0.5f, 0.5f});
  session.store_centroid("cluster_0", {1.0f, 0.0f});

  const auto* stored = session.find_centroid("cluster_0");
  ASSERT_NE(stored, nullptr);
  EXPECT_EQ(*stored, (std::vector<float>{1.0f, 0.0f}));
  EXPECT_EQ(session.find_centroid("cluster_9"), nullptr);
}

TEST(ClusteringSessionTest, TimestampFormat) {
  static const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6})");
  EXPECT_TRUE(std::regex_match(iso_timestamp_now(), iso));

  ClusteringSession session;
  EXPECT_TRUE(std::regex_match(session.created_at(), iso));
}

// =============================================================================
// SECTION 2: Concurrent clustering calls
// =============================================================================

class TabClustererThreadSafetyTest : public ::testing::Test {
protected:
  static constexpr int N_THREADS = 8;
  static constexpr int N_CALLS_PER_THREAD = 5;

  void SetUp() override {
    std::mt19937 gen(99);
    std::normal_distribution<float> normal(0.0f, 1.0f);

    for (int b = 0; b < 4; ++b) {
      std::vector<float> center(32);
      for (auto& x : center) x = normal(gen);
      for (int i = 0; i < 7; ++i) {
        auto v = center;
        for (auto& x : v) x += 0.2f * normal(gen);
        embeddings_.push_back(
            Embedding{"p" + std::to_string(b * 7 + i), std::move(v), "test-model"});
      }
    }
  }

  std::vector<Embedding> embeddings_;
  TabClusterer clusterer_{ClusteringConfig{}};
};

TEST_F(TabClustererThreadSafetyTest, ConcurrentCallsMatchSequentialResult) {
  auto reference = clusterer_.cluster(embeddings_);

  std::atomic<int> mismatch_count{0};
  std::atomic<int> success_count{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < N_THREADS; ++t) {
    threads.emplace_back([&]() {
      for (int call = 0; call < N_CALLS_PER_THREAD; ++call) {
        auto result = clusterer_.try_cluster(embeddings_);
        if (!result) {
          mismatch_count.fetch_add(1, std::memory_order_relaxed);
          continue;
        }

        bool same = result->clusters.size() == reference.clusters.size()
                    && result->unclustered_ids == reference.unclustered_ids;
        for (size_t i = 0; same && i < reference.clusters.size(); ++i) {
          same = result->clusters[i].id == reference.clusters[i].id
                 && result->clusters[i].member_ids == reference.clusters[i].member_ids;
        }

        if (same) {
          success_count.fetch_add(1, std::memory_order_relaxed);
        } else {
          mismatch_count.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatch_count.load(), 0) << "Concurrent calls diverged from the sequential result";
  EXPECT_EQ(success_count.load(), N_THREADS * N_CALLS_PER_THREAD);
}
