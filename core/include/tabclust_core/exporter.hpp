#pragma once
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <vector>

#include "item_store.hpp"
#include "models.hpp"

namespace tabclust {

  // Presentation record: {id, name, tabs: [{id, name}, ...]}
  struct ClusterExport {
    std::string id;
    std::string name;
    std::vector<Item> tabs;
  };

  // Resolve member ids through `store`, dropping ids it does not know.
  // Output follows the order of `clusters`.
  [[nodiscard]] std::vector<ClusterExport> export_clusters(std::span<const Cluster> clusters,
                                                           const IItemStore& store);

  [[nodiscard]] std::string exports_to_json_string(std::span<const ClusterExport> exports);

  void to_json(nlohmann::json& j, const ClusterExport& e);
  void from_json(const nlohmann::json& j, ClusterExport& e);

}  // namespace tabclust
