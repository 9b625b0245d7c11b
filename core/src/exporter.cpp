#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tabclust_core/exporter.hpp>

using json = nlohmann::json;

namespace tabclust {

  std::vector<ClusterExport> export_clusters(std::span<const Cluster> clusters,
                                             const IItemStore& store) {
    std::vector<ClusterExport> exports;
    exports.reserve(clusters.size());

    for (const auto& cluster : clusters) {
      ClusterExport e{cluster.id, cluster.name, {}};
      e.tabs.reserve(cluster.member_ids.size());
      for (const auto& id : cluster.member_ids) {
        if (auto item = store.find(id)) {
          e.tabs.push_back(std::move(*item));
        } else {
          spdlog::debug("Item {} of {} not found in store", id, cluster.id);
        }
      }
      exports.push_back(std::move(e));
    }
    return exports;
  }

  void to_json(json& j, const ClusterExport& e) {
    j = {{"id", e.id}, {"name", e.name}, {"tabs", e.tabs}};
  }

  void from_json(const json& j, ClusterExport& e) {
    j.at("id").get_to(e.id);
    j.at("name").get_to(e.name);
    e.tabs = j.value("tabs", std::vector<Item>{});
  }

  std::string exports_to_json_string(std::span<const ClusterExport> exports) {
    json j = json::array();
    for (const auto& e : exports) j.push_back(e);
    return j.dump();
  }

}  // namespace tabclust
