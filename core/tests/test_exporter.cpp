#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <tabclust_core/exporter.hpp>
#include <tabclust_core/item_store.hpp>
#include <tabclust_core/naming.hpp>
#include <tabclust_core/session.hpp>

using namespace tabclust;
using json = nlohmann::json;

class ExporterTest : public ::testing::Test {
protected:
  void SetUp() override {
    store.add_all(std::vector<Item>{{"t1", "Python docs"},
                                    {"t2", "Rust book"},
                                    {"t3", "Weather"},
                                    {"t4", "News"}});
  }

  InMemoryItemStore store;
  ClusteringSession session{"2024-01-01T00:00:00.000000"};
};

// =============================================================================
// SECTION 1: Item store
// =============================================================================

TEST_F(ExporterTest, StoreFindsItemsById) {
  EXPECT_EQ(store.size(), 4u);
  auto item = store.find("t2");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->name, "Rust book");
  EXPECT_FALSE(store.find("missing").has_value());
}

TEST_F(ExporterTest, StoreAddReplacesExistingItem) {
  store.add(Item{"t1", "Python tutorial"});
  EXPECT_EQ(store.size(), 4u);
  EXPECT_EQ(store.find("t1")->name, "Python tutorial");
  EXPECT_EQ(store.all().front().id, "t1");

  store.clear();
  EXPECT_EQ(store.size(), 0u);
  EXPECT_FALSE(store.find("t1").has_value());
}

// =============================================================================
// SECTION 2: Export
// =============================================================================

TEST_F(ExporterTest, ExportResolvesMembersInOrder) {
  std::vector<Cluster> clusters = {session.new_cluster({"t3", "t1"}),
                                   session.new_cluster({"t2", "t4"})};
  auto exports = export_clusters(clusters, store);

  ASSERT_EQ(exports.size(), 2u);
  EXPECT_EQ(exports[0].id, "cluster_0");
  EXPECT_EQ(exports[0].name, "Cluster 0");
  EXPECT_EQ(exports[0].tabs, (std::vector<Item>{{"t3", "Weather"}, {"t1", "Python docs"}}));
  EXPECT_EQ(exports[1].id, "cluster_1");
  EXPECT_EQ(exports[1].tabs, (std::vector<Item>{{"t2", "Rust book"}, {"t4", "News"}}));
}

TEST_F(ExporterTest, UnknownMembersAreDropped) {
  std::vector<Cluster> clusters = {session.new_cluster({"t1", "gone", "t2"})};
  auto exports = export_clusters(clusters, store);

  ASSERT_EQ(exports.size(), 1u);
  EXPECT_EQ(exports[0].tabs, (std::vector<Item>{{"t1", "Python docs"}, {"t2", "Rust book"}}));
}

TEST_F(ExporterTest, NoClustersExportNothing) {
  std::vector<Cluster> clusters;
  EXPECT_TRUE(export_clusters(clusters, store).empty());

  std::vector<ClusterExport> exports;
  EXPECT_EQ(exports_to_json_string(exports), "[]");
}

TEST_F(ExporterTest, JsonShape) {
  std::vector<Cluster> clusters = {session.new_cluster({"t1"})};
  auto exports = export_clusters(clusters, store);

  auto j = json::parse(exports_to_json_string(exports));
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["id"], "cluster_0");
  EXPECT_EQ(j[0]["name"], "Cluster 0");
  EXPECT_EQ(j[0]["tabs"], json::parse(R"([{"id": "t1", "name": "Python docs"}])"));

  auto loaded = j[0].get<ClusterExport>();
  EXPECT_EQ(loaded.tabs, exports[0].tabs);
}

// =============================================================================
// SECTION 3: Naming
// =============================================================================

class FixedNamer : public IClusterNamer {
public:
  std::unordered_map<std::string, std::string> name_clusters(
      std::span<const NamingRequest> requests) override {
    seen.assign(requests.begin(), requests.end());
    return {{"cluster_0", "Programming"}};
  }

  std::vector<NamingRequest> seen;
};

TEST_F(ExporterTest, NamingRequestsCarryItemNames) {
  std::vector<Cluster> clusters = {session.new_cluster({"t1", "ghost", "t2"}),
                                   session.new_cluster({"t3"})};
  auto requests = build_naming_requests(clusters, store);

  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].cluster_id, "cluster_0");
  EXPECT_EQ(requests[0].item_names, (std::vector<std::string>{"Python docs", "Rust book"}));
  EXPECT_EQ(requests[1].item_names, std::vector<std::string>{"Weather"});
}

TEST_F(ExporterTest, UnnamedClustersGetFallbackName) {
  std::vector<Cluster> clusters = {session.new_cluster({"t1", "t2"}),
                                   session.new_cluster({"t3", "t4"})};

  FixedNamer namer;
  apply_cluster_names(clusters, namer.name_clusters(build_naming_requests(clusters, store)));

  EXPECT_EQ(namer.seen.size(), 2u);
  EXPECT_EQ(clusters[0].name, "Programming");
  EXPECT_EQ(clusters[1].name, "Cluster cluster_1");
}
