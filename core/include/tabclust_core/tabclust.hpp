#pragma once
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "exporter.hpp"
#include "item_store.hpp"
#include "models.hpp"
#include "naming.hpp"
#include "result.hpp"

namespace tabclust {

  // Groups embeddings into bounded-size clusters:
  // normalize -> HDBSCAN (k-means fallback when it finds nothing) -> noise
  // reassignment -> size limiting -> centroids.
  //
  // Holds only configuration; every call runs in its own ClusteringSession, so one
  // instance may serve concurrent calls.
  class TabClusterer {
  public:
    [[nodiscard]] static std::expected<TabClusterer, std::string> from_config_file(
        const std::string& path) noexcept;
    [[nodiscard]] static std::expected<TabClusterer, std::string> from_config_string(
        const std::string& json_str) noexcept;

    // Throws InvalidInputError when `config` does not validate
    explicit TabClusterer(ClusteringConfig config = {});
    ~TabClusterer() = default;

    TabClusterer(TabClusterer&&) = default;
    TabClusterer& operator=(TabClusterer&&) = default;
    TabClusterer(const TabClusterer&) = delete;
    TabClusterer& operator=(const TabClusterer&) = delete;

    // Throws InvalidInputError for malformed input. An empty input yields an empty result.
    [[nodiscard]] ClusteringResult cluster(std::span<const Embedding> embeddings) const;

    // Non-throwing variant; the error string is suitable for a generic failure response
    [[nodiscard]] std::expected<ClusteringResult, std::string> try_cluster(
        std::span<const Embedding> embeddings) const noexcept;

    [[nodiscard]] const ClusteringConfig& config() const noexcept { return config_; }

  private:
    ClusteringConfig config_;
  };

  // Cluster, optionally name through `namer`, and export against `store`.
  // Returns an empty list when no grouping is possible.
  [[nodiscard]] std::vector<ClusterExport> run_clustering_flow(
      std::span<const Embedding> embeddings, const IItemStore& store,
      IClusterNamer* namer = nullptr, const ClusteringConfig& config = {});

}  // namespace tabclust
