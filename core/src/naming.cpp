#include <spdlog/fmt/fmt.h>
#include <tabclust_core/naming.hpp>

namespace tabclust {

  std::vector<NamingRequest> build_naming_requests(std::span<const Cluster> clusters,
                                                   const IItemStore& store) {
    std::vector<NamingRequest> requests;
    requests.reserve(clusters.size());
    for (const auto& cluster : clusters) {
      NamingRequest request{cluster.id, {}};
      for (const auto& id : cluster.member_ids) {
        if (auto item = store.find(id)) request.item_names.push_back(item->name);
      }
      requests.push_back(std::move(request));
    }
    return requests;
  }

  void apply_cluster_names(std::vector<Cluster>& clusters,
                           const std::unordered_map<std::string, std::string>& names) {
    for (auto& cluster : clusters) {
      auto it = names.find(cluster.id);
      cluster.name = it != names.end() ? it->second : fmt::format("Cluster {}", cluster.id);
    }
  }

}  // namespace tabclust
