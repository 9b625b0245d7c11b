#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "models.hpp"

namespace tabclust {

  // Per-invocation state: cluster id counter, centroid table and the run timestamp.
  // One session per clustering call; nothing survives the call.
  class ClusteringSession {
  public:
    ClusteringSession();
    explicit ClusteringSession(std::string created_at);
    ~ClusteringSession() = default;

    ClusteringSession(ClusteringSession&&) = default;
    ClusteringSession& operator=(ClusteringSession&&) = default;
    ClusteringSession(const ClusteringSession&) = delete;
    ClusteringSession& operator=(const ClusteringSession&) = delete;

    // Issue a fresh cluster: id "cluster_N", placeholder name "Cluster N",
    // the run timestamp and `size` / `created_at` metadata
    [[nodiscard]] Cluster new_cluster(std::vector<std::string> member_ids);

    void store_centroid(const std::string& cluster_id, std::vector<float> centroid);
    [[nodiscard]] const std::vector<float>* find_centroid(const std::string& cluster_id) const;

    [[nodiscard]] const std::unordered_map<std::string, std::vector<float>>& centroids()
        const noexcept {
      return centroids_;
    }
    [[nodiscard]] const std::string& created_at() const noexcept { return created_at_; }
    [[nodiscard]] int clusters_issued() const noexcept { return next_id_; }

  private:
    int next_id_ = 0;
    std::string created_at_;
    std::unordered_map<std::string, std::vector<float>> centroids_;
  };

  // Current UTC time as ISO-8601 with microseconds, e.g. 2024-05-01T12:30:00.123456
  [[nodiscard]] std::string iso_timestamp_now();

}  // namespace tabclust
