#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <tabclust_core/normalizer.hpp>
#include <tabclust_core/session.hpp>
#include <tabclust_core/size_limiter.hpp>
#include <vector>

using namespace tabclust;

class SizeLimiterTest : public ::testing::Test {
protected:
  static constexpr size_t DIM = 8;

  std::vector<Embedding> embeddings;
  ClusteringSession session{"2024-01-01T00:00:00.000000"};

  // Four points around `base`, each nudged along its own axis (3..6)
  void add_blob(const std::string& prefix, std::vector<float> base, int count = 4) {
    for (int i = 0; i < count; ++i) {
      auto v = base;
      v[3 + static_cast<size_t>(i)] += 0.02f;
      embeddings.push_back(Embedding{prefix + std::to_string(i), v, "test-model"});
    }
  }

  static std::vector<float> direction(std::initializer_list<std::pair<size_t, float>> parts) {
    std::vector<float> v(DIM, 0.0f);
    for (auto [axis, value] : parts) v[axis] = value;
    return v;
  }

  std::vector<std::string> all_ids() const {
    std::vector<std::string> ids;
    for (const auto& e : embeddings) ids.push_back(e.item_id);
    return ids;
  }

  static std::set<std::string> members(const Cluster& cluster) {
    return {cluster.member_ids.begin(), cluster.member_ids.end()};
  }

  static const Cluster* holding(const SizeLimitResult& result, const std::string& id) {
    for (const auto& cluster : result.clusters) {
      if (std::find(cluster.member_ids.begin(), cluster.member_ids.end(), id)
          != cluster.member_ids.end()) {
        return &cluster;
      }
    }
    return nullptr;
  }
};

TEST_F(SizeLimiterTest, ClustersWithinLimitAreUnchanged) {
  add_blob("a", direction({{0, 1.0f}}), 3);
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters = {session.new_cluster(all_ids())};
  SizeLimiter limiter(2, 5, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 1u);
  EXPECT_EQ(result.clusters[0].id, "cluster_0");
  EXPECT_EQ(result.clusters[0].member_ids, all_ids());
  EXPECT_FALSE(result.clusters[0].meta<std::string>("parent_cluster").has_value());
  EXPECT_EQ(result.n_splits, 0);
  EXPECT_TRUE(result.dropped_ids.empty());
}

TEST_F(SizeLimiterTest, SplitsOversizedCluster) {
  add_blob("a", direction({{0, 1.0f}}), 3);
  add_blob("b", direction({{1, 1.0f}}), 3);
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters = {session.new_cluster(all_ids())};
  SizeLimiter limiter(2, 5, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 2u);
  EXPECT_EQ(result.n_splits, 1);

  std::set<std::set<std::string>> groups;
  for (const auto& cluster : result.clusters) {
    groups.insert(members(cluster));
    EXPECT_EQ(cluster.meta<std::string>("parent_cluster"), "cluster_0");
    EXPECT_EQ(cluster.meta<std::string>("split_method"), "kmeans");
    EXPECT_EQ(cluster.meta<std::int64_t>("size"), 3);
    EXPECT_NE(cluster.id, "cluster_0");
  }
  std::set<std::set<std::string>> expected = {{"a0", "a1", "a2"}, {"b0", "b1", "b2"}};
  EXPECT_EQ(groups, expected);
}

TEST_F(SizeLimiterTest, SplitsRecursivelyUntilWithinLimit) {
  // a and b are close to each other and far from c; k=2 first separates c
  add_blob("a", direction({{0, 1.0f}}));
  add_blob("b", direction({{0, 1.0f}, {1, 0.3f}}));
  add_blob("c", direction({{2, 1.0f}}));
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters = {session.new_cluster(all_ids())};
  SizeLimiter limiter(2, 7, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 3u);
  EXPECT_EQ(result.n_splits, 2);
  for (const auto& cluster : result.clusters) EXPECT_LE(cluster.size(), 7u);

  const Cluster* a = holding(result, "a0");
  const Cluster* b = holding(result, "b0");
  const Cluster* c = holding(result, "c0");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  ASSERT_NE(c, nullptr);

  EXPECT_EQ(members(*a), (std::set<std::string>{"a0", "a1", "a2", "a3"}));
  EXPECT_EQ(members(*b), (std::set<std::string>{"b0", "b1", "b2", "b3"}));
  EXPECT_EQ(members(*c), (std::set<std::string>{"c0", "c1", "c2", "c3"}));

  // a and b come from an intermediate cluster that itself was split
  EXPECT_EQ(c->meta<std::string>("parent_cluster"), "cluster_0");
  auto a_parent = a->meta<std::string>("parent_cluster");
  ASSERT_TRUE(a_parent.has_value());
  EXPECT_NE(*a_parent, "cluster_0");
  EXPECT_EQ(b->meta<std::string>("parent_cluster"), a_parent);
  EXPECT_EQ(session.clusters_issued(), 5);
}

TEST_F(SizeLimiterTest, DropsUndersizedFragments) {
  add_blob("a", direction({{0, 1.0f}}), 4);
  embeddings.push_back(Embedding{"lonely", direction({{2, 1.0f}}), "test-model"});
  embeddings.push_back(Embedding{"a4", direction({{0, 1.0f}, {7, 0.02f}}), "test-model"});
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters = {session.new_cluster(all_ids())};
  SizeLimiter limiter(2, 5, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 1u);
  EXPECT_EQ(members(result.clusters[0]),
            (std::set<std::string>{"a0", "a1", "a2", "a3", "a4"}));
  EXPECT_EQ(result.dropped_ids, std::vector<std::string>{"lonely"});
  EXPECT_EQ(result.n_splits, 1);
}

TEST_F(SizeLimiterTest, KeepsClusterWhenSplitIsDegenerate) {
  for (int i = 0; i < 6; ++i) {
    embeddings.push_back(Embedding{"same" + std::to_string(i), direction({{0, 1.0f}}), "m"});
  }
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters = {session.new_cluster(all_ids())};
  SizeLimiter limiter(2, 5, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 1u);
  EXPECT_EQ(result.clusters[0].id, "cluster_0");
  EXPECT_EQ(result.clusters[0].size(), 6u);
  EXPECT_EQ(result.n_splits, 0);
  EXPECT_EQ(result.n_failed_splits, 1);
}

TEST_F(SizeLimiterTest, PreservesClusterOrder) {
  add_blob("a", direction({{0, 1.0f}}), 2);
  add_blob("b", direction({{1, 1.0f}}), 2);
  auto set = normalize_embeddings(embeddings);

  std::vector<Cluster> clusters
      = {session.new_cluster({"b0", "b1"}), session.new_cluster({"a0", "a1"})};
  SizeLimiter limiter(2, 5, CentroidSpec{});
  auto result = limiter.apply(clusters, set, session);

  ASSERT_EQ(result.clusters.size(), 2u);
  EXPECT_EQ(result.clusters[0].id, "cluster_0");
  EXPECT_EQ(result.clusters[1].id, "cluster_1");
}

TEST_F(SizeLimiterTest, NonPositiveLimitThrows) {
  EXPECT_THROW(SizeLimiter(2, 0, CentroidSpec{}), std::invalid_argument);
}
