#pragma once
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace tabclust {

  // Clustering hyperparameters (full config for reproducibility)
  struct ClusteringConfig {
    // Density step
    int min_cluster_size = 2;
    int min_samples = 1;
    float cluster_selection_epsilon = 0.05f;

    // Post-processing
    int max_cluster_size = 10;
    double noise_similarity_threshold = 0.6;

    // Fallback partition
    std::vector<int> fallback_cluster_counts = {2, 3, 4, 5};
    int fallback_min_group_size = 2;

    // k-means (fallback and splitting)
    std::uint32_t random_state = 42;
    int n_init = 10;
    int max_iter = 300;
    float tol = 1e-4f;

    [[nodiscard]] static ClusteringConfig from_json(const std::string& path);
    [[nodiscard]] static ClusteringConfig from_json_string(const std::string& json_str);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;

    void validate() const;
  };

  void to_json(nlohmann::json& j, const ClusteringConfig& c);
  void from_json(const nlohmann::json& j, ClusteringConfig& c);

}  // namespace tabclust
