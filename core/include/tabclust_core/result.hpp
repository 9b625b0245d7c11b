#pragma once
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "models.hpp"

namespace tabclust {

  // Version for format evolution
  inline constexpr const char* RESULT_FORMAT_VERSION = "1.0";

  // How the final partition was obtained
  inline constexpr const char* METHOD_DENSITY = "hdbscan";
  inline constexpr const char* METHOD_FALLBACK = "kmeans_fallback";
  inline constexpr const char* METHOD_NONE = "none";

  struct ClusteringMetrics {
    int n_samples = 0;
    int n_noise = 0;       // density noise before reassignment
    int n_reassigned = 0;  // noise points attached to a cluster
    int n_unclustered = 0;
    std::string method = METHOD_NONE;
    std::optional<int> fallback_k;
    int n_splits = 0;
    std::vector<int> cluster_sizes;
  };

  // Output of one clustering run
  struct ClusteringResult {
    std::string version = RESULT_FORMAT_VERSION;
    std::string created_at;

    std::vector<Cluster> clusters;
    std::vector<std::string> unclustered_ids;

    ClusteringConfig config;
    ClusteringMetrics metrics;

    // Serialization (zero-copy via mmap)
    [[nodiscard]] static ClusteringResult from_json(const std::string& path);
    [[nodiscard]] static ClusteringResult from_json_string(const std::string& json_str);
    [[nodiscard]] static ClusteringResult from_msgpack(const std::string& path);
    [[nodiscard]] static ClusteringResult from_msgpack_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    void to_msgpack(const std::string& path) const;
    [[nodiscard]] std::string to_msgpack_string() const;

    void validate() const;

    [[nodiscard]] int n_clusters() const noexcept { return static_cast<int>(clusters.size()); }
    [[nodiscard]] const Cluster* find_cluster(const std::string& id) const;
    [[nodiscard]] const std::string& method() const noexcept { return metrics.method; }
  };

  void to_json(nlohmann::json& j, const ClusteringMetrics& m);
  void from_json(const nlohmann::json& j, ClusteringMetrics& m);

}  // namespace tabclust
