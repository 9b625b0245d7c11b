#pragma once
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "item_store.hpp"
#include "models.hpp"

namespace tabclust {

  struct NamingRequest {
    std::string cluster_id;
    std::vector<std::string> item_names;
  };

  // External collaborator that produces display names for clusters
  class IClusterNamer {
  public:
    virtual ~IClusterNamer() = default;

    IClusterNamer(const IClusterNamer&) = delete;
    IClusterNamer& operator=(const IClusterNamer&) = delete;
    IClusterNamer(IClusterNamer&&) = delete;
    IClusterNamer& operator=(IClusterNamer&&) = delete;

    // Returns cluster id -> name; clusters may be left out
    [[nodiscard]] virtual std::unordered_map<std::string, std::string> name_clusters(
        std::span<const NamingRequest> requests)
        = 0;

  protected:
    IClusterNamer() = default;
  };

  // One request per cluster with the names of its resolvable items
  [[nodiscard]] std::vector<NamingRequest> build_naming_requests(std::span<const Cluster> clusters,
                                                                 const IItemStore& store);

  // Assign namer output; clusters left out are named "Cluster <id>"
  void apply_cluster_names(std::vector<Cluster>& clusters,
                           const std::unordered_map<std::string, std::string>& names);

}  // namespace tabclust
