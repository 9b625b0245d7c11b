#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>
#include <tabclust_core/config.hpp>
#include <tabclust_core/errors.hpp>

using json = nlohmann::json;

namespace tabclust {

  // ============================================================================
  // JSON Serialization - ClusteringConfig
  // ============================================================================

  void to_json(json& j, const ClusteringConfig& c) {
    j = {{"min_cluster_size", c.min_cluster_size},
         {"min_samples", c.min_samples},
         {"cluster_selection_epsilon", c.cluster_selection_epsilon},
         {"max_cluster_size", c.max_cluster_size},
         {"noise_similarity_threshold", c.noise_similarity_threshold},
         {"fallback_cluster_counts", c.fallback_cluster_counts},
         {"fallback_min_group_size", c.fallback_min_group_size},
         {"random_state", c.random_state},
         {"n_init", c.n_init},
         {"max_iter", c.max_iter},
         {"tol", c.tol}};
  }

  void from_json(const json& j, ClusteringConfig& c) {
    c.min_cluster_size = j.value("min_cluster_size", 2);
    c.min_samples = j.value("min_samples", 1);
    c.cluster_selection_epsilon = j.value("cluster_selection_epsilon", 0.05f);
    c.max_cluster_size = j.value("max_cluster_size", 10);
    c.noise_similarity_threshold = j.value("noise_similarity_threshold", 0.6);
    c.fallback_cluster_counts
        = j.value("fallback_cluster_counts", std::vector<int>{2, 3, 4, 5});
    c.fallback_min_group_size = j.value("fallback_min_group_size", 2);
    c.random_state = j.value("random_state", std::uint32_t{42});
    c.n_init = j.value("n_init", 10);
    c.max_iter = j.value("max_iter", 300);
    c.tol = j.value("tol", 1e-4f);
  }

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  ClusteringConfig ClusteringConfig::from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open config file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  ClusteringConfig ClusteringConfig::from_json_string(const std::string& json_str) {
    json j = json::parse(json_str);
    if (!j.is_object()) {
      throw InvalidInputError("Clustering config must be a JSON object");
    }

    auto config = j.get<ClusteringConfig>();
    config.validate();
    return config;
  }

  std::string ClusteringConfig::to_json_string() const {
    json j = *this;
    return j.dump(2);
  }

  void ClusteringConfig::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open config file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void ClusteringConfig::validate() const {
    if (min_cluster_size < 1) {
      throw InvalidInputError(
          fmt::format("min_cluster_size must be at least 1, got {}", min_cluster_size));
    }
    if (min_samples < 1) {
      throw InvalidInputError(fmt::format("min_samples must be at least 1, got {}", min_samples));
    }
    if (max_cluster_size < 1) {
      throw InvalidInputError(
          fmt::format("max_cluster_size must be at least 1, got {}", max_cluster_size));
    }
    if (max_cluster_size < min_cluster_size) {
      throw InvalidInputError(
          fmt::format("max_cluster_size ({}) must not be smaller than min_cluster_size ({})",
                      max_cluster_size, min_cluster_size));
    }
    if (!(noise_similarity_threshold >= -1.0 && noise_similarity_threshold <= 1.0)) {
      throw InvalidInputError(
          fmt::format("noise_similarity_threshold must be in range [-1.0, 1.0], got {}",
                      noise_similarity_threshold));
    }
    if (!(cluster_selection_epsilon >= 0.0f)) {
      throw InvalidInputError(fmt::format("cluster_selection_epsilon must be non-negative, got {}",
                                          cluster_selection_epsilon));
    }
    if (fallback_cluster_counts.empty()) {
      throw InvalidInputError("fallback_cluster_counts cannot be empty");
    }
    for (size_t i = 0; i < fallback_cluster_counts.size(); ++i) {
      if (fallback_cluster_counts[i] < 2) {
        throw InvalidInputError(fmt::format("fallback_cluster_counts[{}] must be at least 2, got {}",
                                            i, fallback_cluster_counts[i]));
      }
    }
    if (fallback_min_group_size < 1) {
      throw InvalidInputError(fmt::format("fallback_min_group_size must be at least 1, got {}",
                                          fallback_min_group_size));
    }
    if (n_init < 1) {
      throw InvalidInputError(fmt::format("n_init must be at least 1, got {}", n_init));
    }
    if (max_iter < 1) {
      throw InvalidInputError(fmt::format("max_iter must be at least 1, got {}", max_iter));
    }
    if (!(tol >= 0.0f)) {
      throw InvalidInputError(fmt::format("tol must be non-negative, got {}", tol));
    }
  }

}  // namespace tabclust
