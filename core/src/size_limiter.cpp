#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tabclust_core/size_limiter.hpp>

namespace tabclust {

  SizeLimiter::SizeLimiter(int min_cluster_size, int max_cluster_size, CentroidSpec kmeans)
      : min_cluster_size_(min_cluster_size), max_cluster_size_(max_cluster_size), kmeans_(kmeans) {
    if (max_cluster_size_ < 1) [[unlikely]] {
      throw std::invalid_argument("max_cluster_size must be positive");
    }
  }

  SizeLimitResult SizeLimiter::apply(std::vector<Cluster> clusters, const NormalizedSet& set,
                                     ClusteringSession& session) const {
    SizeLimitResult out;
    for (auto& cluster : clusters) {
      limit(std::move(cluster), set, session, out);
    }
    return out;
  }

  void SizeLimiter::limit(Cluster cluster, const NormalizedSet& set, ClusteringSession& session,
                          SizeLimitResult& out) const {
    const auto size = static_cast<int>(cluster.size());
    if (size <= max_cluster_size_) {
      out.clusters.push_back(std::move(cluster));
      return;
    }

    const int k = std::max(2, (size + max_cluster_size_ - 1) / max_cluster_size_);
    spdlog::info("Splitting {} ({} members) into {} sub-clusters", cluster.id, size, k);

    PartitionResult partition;
    try {
      CentroidSpec spec = kmeans_;
      spec.n_clusters = k;
      partition = create_backend(spec)->partition(set.gather(cluster.member_ids));
    } catch (const std::exception& e) {
      spdlog::warn("Failed to split {}: {}", cluster.id, e.what());
      ++out.n_failed_splits;
      out.clusters.push_back(std::move(cluster));
      return;
    }

    const auto groups = partition.groups();
    const bool any_viable = std::any_of(groups.begin(), groups.end(), [&](const auto& group) {
      return static_cast<int>(group.size()) >= min_cluster_size_;
    });
    const bool degenerate = std::any_of(groups.begin(), groups.end(), [&](const auto& group) {
      return static_cast<int>(group.size()) >= size;
    });
    if (!any_viable || degenerate) {
      spdlog::warn("Failed to split {}: no usable sub-clusters, keeping it whole", cluster.id);
      ++out.n_failed_splits;
      out.clusters.push_back(std::move(cluster));
      return;
    }

    ++out.n_splits;
    for (const auto& group : groups) {
      std::vector<std::string> member_ids;
      member_ids.reserve(group.size());
      for (Eigen::Index row : group) {
        member_ids.push_back(cluster.member_ids[static_cast<size_t>(row)]);
      }

      if (static_cast<int>(group.size()) < min_cluster_size_) {
        spdlog::debug("Dropping {} members of an undersized fragment of {}", member_ids.size(),
                      cluster.id);
        out.dropped_ids.insert(out.dropped_ids.end(), member_ids.begin(), member_ids.end());
        continue;
      }

      auto sub = session.new_cluster(std::move(member_ids));
      sub.metadata["parent_cluster"] = cluster.id;
      sub.metadata["split_method"] = std::string("kmeans");
      limit(std::move(sub), set, session, out);
    }
  }

}  // namespace tabclust
