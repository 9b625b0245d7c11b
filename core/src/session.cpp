#include <chrono>
#include <cstdint>
#include <ctime>
#include <spdlog/fmt/fmt.h>
#include <tabclust_core/session.hpp>

namespace tabclust {

  std::string iso_timestamp_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::time_t seconds = system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    return fmt::format("{}.{:06}", date, static_cast<long long>(micros));
  }

  ClusteringSession::ClusteringSession() : created_at_(iso_timestamp_now()) {}

  ClusteringSession::ClusteringSession(std::string created_at)
      : created_at_(std::move(created_at)) {}

  Cluster ClusteringSession::new_cluster(std::vector<std::string> member_ids) {
    int sequence = next_id_++;

    Cluster cluster;
    cluster.id = fmt::format("cluster_{}", sequence);
    cluster.name = placeholder_cluster_name(sequence);
    cluster.created_at = created_at_;
    cluster.metadata["size"] = static_cast<std::int64_t>(member_ids.size());
    cluster.metadata["created_at"] = created_at_;
    cluster.member_ids = std::move(member_ids);
    return cluster;
  }

  void ClusteringSession::store_centroid(const std::string& cluster_id,
                                         std::vector<float> centroid) {
    centroids_[cluster_id] = std::move(centroid);
  }

  const std::vector<float>* ClusteringSession::find_centroid(const std::string& cluster_id) const {
    auto it = centroids_.find(cluster_id);
    return it == centroids_.end() ? nullptr : &it->second;
  }

}  // namespace tabclust
