#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <map>
#include <msgpack.hpp>
#include <set>
#include <tabclust_core/result.hpp>
#include <tabclust_core/tabclust.hpp>

namespace fs = std::filesystem;
using namespace tabclust;

class ResultIntegrationTest : public ::testing::Test {
protected:
  static fs::path get_test_data_dir() {
    return fs::path(__FILE__).parent_path().parent_path() / "fixtures";
  }

  static fs::path get_result_path(const std::string& name) { return get_test_data_dir() / name; }

  // A real run: two tight groups plus one unrelated item
  static ClusteringResult clustered_result() {
    std::vector<Embedding> embeddings;
    const float c = 0.97f;
    const float s = std::sqrt(1.0f - c * c);
    for (size_t j = 1; j <= 6; ++j) {
      std::vector<float> a(9, 0.0f);
      a[0] = 1.0f;
      a[j] += 0.1f;
      embeddings.push_back(Embedding{"a" + std::to_string(j), a, "test-model"});

      std::vector<float> b(9, 0.0f);
      b[0] = c;
      b[7] = s;
      b[j] += 0.1f;
      embeddings.push_back(Embedding{"b" + std::to_string(j), b, "test-model"});
    }
    std::vector<float> lone(9, 0.0f);
    lone[8] = 1.0f;
    embeddings.push_back(Embedding{"lone", lone, "test-model"});

    return TabClusterer().cluster(embeddings);
  }

  static void expect_same_clusters(const ClusteringResult& loaded,
                                   const ClusteringResult& original) {
    ASSERT_EQ(loaded.clusters.size(), original.clusters.size());
    for (size_t i = 0; i < original.clusters.size(); ++i) {
      const auto& a = loaded.clusters[i];
      const auto& b = original.clusters[i];
      EXPECT_EQ(a.id, b.id);
      EXPECT_EQ(a.name, b.name);
      EXPECT_EQ(std::set<std::string>(a.member_ids.begin(), a.member_ids.end()),
                std::set<std::string>(b.member_ids.begin(), b.member_ids.end()));
      EXPECT_EQ(a.centroid, b.centroid);
      EXPECT_EQ(a.description, b.description);
      EXPECT_EQ(a.created_at, b.created_at);
      EXPECT_EQ(a.metadata, b.metadata);
    }
    EXPECT_EQ(loaded.unclustered_ids, original.unclustered_ids);
  }
};

TEST_F(ResultIntegrationTest, LoadFromJsonFile) {
  auto path = get_result_path("sample_result.json");
  ASSERT_TRUE(fs::exists(path));

  auto result = ClusteringResult::from_json(path.string());

  EXPECT_EQ(result.version, "1.0");
  EXPECT_EQ(result.n_clusters(), 2);
  EXPECT_EQ(result.method(), METHOD_DENSITY);
  EXPECT_EQ(result.unclustered_ids, std::vector<std::string>{"t6"});

  const auto* split = result.find_cluster("cluster_2");
  ASSERT_NE(split, nullptr);
  EXPECT_EQ(split->description, "Split from a larger group");
  EXPECT_EQ(split->meta<std::string>("parent_cluster"), "cluster_1");
  EXPECT_EQ(split->meta<std::int64_t>("size"), 2);
  EXPECT_EQ(result.find_cluster("cluster_1"), nullptr);

  EXPECT_EQ(result.clusters[0].centroid, (std::vector<float>{0.5f, 0.25f, 0.125f}));
  EXPECT_NO_THROW(result.validate());
}

TEST_F(ResultIntegrationTest, JsonRoundTrip) {
  auto original = clustered_result();
  ASSERT_EQ(original.n_clusters(), 2);

  auto loaded = ClusteringResult::from_json_string(original.to_json_string());

  expect_same_clusters(loaded, original);
  EXPECT_EQ(loaded.created_at, original.created_at);
  EXPECT_EQ(loaded.metrics.method, original.metrics.method);
  EXPECT_EQ(loaded.metrics.cluster_sizes, original.metrics.cluster_sizes);
  EXPECT_EQ(loaded.config.max_cluster_size, original.config.max_cluster_size);
  EXPECT_NO_THROW(loaded.validate());
}

TEST_F(ResultIntegrationTest, MsgpackRoundTrip) {
  auto original = clustered_result();
  auto loaded = ClusteringResult::from_msgpack_string(original.to_msgpack_string());

  expect_same_clusters(loaded, original);
  EXPECT_EQ(loaded.version, original.version);
  EXPECT_EQ(loaded.metrics.n_samples, original.metrics.n_samples);
  EXPECT_EQ(loaded.metrics.n_unclustered, original.metrics.n_unclustered);
  EXPECT_DOUBLE_EQ(loaded.config.noise_similarity_threshold,
                  original.config.noise_similarity_threshold);
  EXPECT_EQ(loaded.config.fallback_cluster_counts, original.config.fallback_cluster_counts);
  EXPECT_NO_THROW(loaded.validate());
}

TEST_F(ResultIntegrationTest, FallbackMetricsRoundTrip) {
  std::vector<Embedding> embeddings;
  for (size_t k = 0; k < 6; ++k) {
    std::vector<float> v(6, 0.0f);
    v[k] = 1.0f;
    embeddings.push_back(Embedding{"t" + std::to_string(k), v, "test-model"});
  }
  auto original = TabClusterer().cluster(embeddings);
  ASSERT_EQ(original.method(), METHOD_FALLBACK);

  auto from_json = ClusteringResult::from_json_string(original.to_json_string());
  auto from_msgpack = ClusteringResult::from_msgpack_string(original.to_msgpack_string());

  EXPECT_EQ(from_json.metrics.fallback_k, 2);
  EXPECT_EQ(from_msgpack.metrics.fallback_k, 2);
  EXPECT_NO_THROW(from_json.validate());
  EXPECT_NO_THROW(from_msgpack.validate());
}

TEST_F(ResultIntegrationTest, CentroidsArePackedAsBinary) {
  auto original = clustered_result();
  auto data = original.to_msgpack_string();

  msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
  auto top = handle.get().as<std::map<std::string, msgpack::object>>();
  ASSERT_TRUE(top.contains("clusters"));

  auto clusters = top.at("clusters").as<std::vector<msgpack::object>>();
  ASSERT_EQ(clusters.size(), original.clusters.size());
  auto first = clusters[0].as<std::map<std::string, msgpack::object>>();
  EXPECT_EQ(first.at("centroid_embedding").type, msgpack::type::BIN);
  EXPECT_EQ(first.at("centroid_embedding").via.bin.size,
            original.clusters[0].centroid->size() * sizeof(float));
}

TEST_F(ResultIntegrationTest, JsonToMsgpackConversion) {
  auto from_json = ClusteringResult::from_json(get_result_path("sample_result.json").string());
  auto from_msgpack = ClusteringResult::from_msgpack_string(from_json.to_msgpack_string());

  expect_same_clusters(from_msgpack, from_json);
  EXPECT_EQ(from_msgpack.metrics.n_splits, from_json.metrics.n_splits);
}

TEST_F(ResultIntegrationTest, FileIOJsonRoundTrip) {
  auto original = clustered_result();
  auto temp_path = fs::temp_directory_path() / "test_tabclust_result_roundtrip.json";

  original.to_json(temp_path.string());
  ASSERT_TRUE(fs::exists(temp_path));

  auto loaded = ClusteringResult::from_json(temp_path.string());
  expect_same_clusters(loaded, original);

  fs::remove(temp_path);
}

TEST_F(ResultIntegrationTest, FileIOMsgpackRoundTrip) {
  auto original = clustered_result();
  auto temp_path = fs::temp_directory_path() / "test_tabclust_result_roundtrip.msgpack";

  original.to_msgpack(temp_path.string());
  ASSERT_TRUE(fs::exists(temp_path));

  auto loaded = ClusteringResult::from_msgpack(temp_path.string());
  expect_same_clusters(loaded, original);

  fs::remove(temp_path);
}

TEST_F(ResultIntegrationTest, MissingFilesThrow) {
  EXPECT_THROW((void)ClusteringResult::from_json("/nonexistent/result.json"), std::runtime_error);
  EXPECT_THROW((void)ClusteringResult::from_msgpack("/nonexistent/result.msgpack"),
               std::runtime_error);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ResultIntegrationTest, ValidationPassesForValidResult) {
  auto result = clustered_result();
  EXPECT_NO_THROW(result.validate());
  EXPECT_EQ(result.unclustered_ids, std::vector<std::string>{"lone"});
}

TEST_F(ResultIntegrationTest, ValidationRejectsOverlappingClusters) {
  auto result = ClusteringResult::from_json(get_result_path("sample_result.json").string());
  result.clusters[1].member_ids.push_back("t1");
  result.metrics.cluster_sizes[1] = 3;
  result.metrics.n_samples = 7;
  EXPECT_THROW(result.validate(), std::invalid_argument);
}

TEST_F(ResultIntegrationTest, ValidationRejectsInconsistentMetrics) {
  auto base = ClusteringResult::from_json(get_result_path("sample_result.json").string());

  auto wrong_count = base;
  wrong_count.metrics.n_samples = 10;
  EXPECT_THROW(wrong_count.validate(), std::invalid_argument);

  auto wrong_sizes = base;
  wrong_sizes.metrics.cluster_sizes = {3};
  EXPECT_THROW(wrong_sizes.validate(), std::invalid_argument);

  auto stray_fallback = base;
  stray_fallback.metrics.fallback_k = 2;
  EXPECT_THROW(stray_fallback.validate(), std::invalid_argument);

  auto none_with_clusters = base;
  none_with_clusters.metrics.method = METHOD_NONE;
  EXPECT_THROW(none_with_clusters.validate(), std::invalid_argument);

  auto unknown_method = base;
  unknown_method.metrics.method = "agglomerative";
  EXPECT_THROW(unknown_method.validate(), std::invalid_argument);
}

TEST_F(ResultIntegrationTest, ValidationRejectsBadClusters) {
  auto base = ClusteringResult::from_json(get_result_path("sample_result.json").string());

  auto duplicate_id = base;
  duplicate_id.clusters[1].id = "cluster_0";
  EXPECT_THROW(duplicate_id.validate(), std::invalid_argument);

  auto ragged = base;
  ragged.clusters[1].centroid = std::vector<float>{0.1f, 0.2f};
  EXPECT_THROW(ragged.validate(), std::invalid_argument);

  auto both = base;
  both.unclustered_ids = {"t4"};
  EXPECT_THROW(both.validate(), std::invalid_argument);
}
