#include <spdlog/spdlog.h>
#include <tabclust_core/centroids.hpp>
#include <tabclust_core/fallback.hpp>
#include <tabclust_core/noise_reassigner.hpp>
#include <tabclust_core/normalizer.hpp>
#include <tabclust_core/partition_backend.hpp>
#include <tabclust_core/session.hpp>
#include <tabclust_core/size_limiter.hpp>
#include <tabclust_core/tabclust.hpp>
#include <unordered_set>

namespace tabclust {

  namespace {

    CentroidSpec kmeans_spec(const ClusteringConfig& config) {
      return CentroidSpec{.n_clusters = 2,
                          .random_state = config.random_state,
                          .n_init = config.n_init,
                          .max_iter = config.max_iter,
                          .tol = config.tol};
    }

    std::vector<Cluster> clusters_from_labels(const PartitionResult& partition,
                                              const NormalizedSet& set,
                                              ClusteringSession& session) {
      std::vector<Cluster> clusters;
      auto groups = partition.groups();
      for (size_t label = 0; label < groups.size(); ++label) {
        if (groups[label].empty()) continue;

        std::vector<std::string> member_ids;
        member_ids.reserve(groups[label].size());
        for (Eigen::Index row : groups[label]) {
          member_ids.push_back(set.ids[static_cast<size_t>(row)]);
        }

        auto cluster = session.new_cluster(std::move(member_ids));
        cluster.metadata["method"] = std::string(METHOD_DENSITY);
        cluster.metadata["hdbscan_label"] = static_cast<std::int64_t>(label);
        clusters.push_back(std::move(cluster));
      }
      return clusters;
    }

  }  // namespace

  std::expected<TabClusterer, std::string> TabClusterer::from_config_file(
      const std::string& path) noexcept {
    try {
      return TabClusterer(ClusteringConfig::from_json(path));
    } catch (const std::exception& e) {
      return std::unexpected(e.what());
    }
  }

  std::expected<TabClusterer, std::string> TabClusterer::from_config_string(
      const std::string& json_str) noexcept {
    try {
      return TabClusterer(ClusteringConfig::from_json_string(json_str));
    } catch (const std::exception& e) {
      return std::unexpected(e.what());
    }
  }

  TabClusterer::TabClusterer(ClusteringConfig config) : config_(std::move(config)) {
    config_.validate();
  }

  ClusteringResult TabClusterer::cluster(std::span<const Embedding> embeddings) const {
    ClusteringSession session;

    ClusteringResult result;
    result.config = config_;
    result.created_at = session.created_at();

    auto set = normalize_embeddings(embeddings);
    const auto n = static_cast<int>(set.size());
    result.metrics.n_samples = n;
    if (n == 0) {
      spdlog::info("No embeddings to cluster");
      return result;
    }

    auto density = create_backend(DensitySpec{
        .min_cluster_size = config_.min_cluster_size,
        .min_samples = config_.min_samples,
        .cluster_selection_epsilon = config_.cluster_selection_epsilon,
    });
    auto partition = density->partition(set.vectors);
    result.metrics.n_noise = static_cast<int>(partition.noise_count());

    std::vector<Cluster> clusters;
    if (partition.n_clusters == 0) {
      spdlog::info("HDBSCAN found no clusters in {} samples, falling back to k-means", n);
      FallbackPartitioner fallback(config_.fallback_cluster_counts,
                                   config_.fallback_min_group_size, kmeans_spec(config_));
      auto fallback_result = fallback.partition(set, session);
      clusters = std::move(fallback_result.clusters);
      if (fallback_result.k) {
        result.metrics.method = METHOD_FALLBACK;
        result.metrics.fallback_k = fallback_result.k;
      }
    } else {
      result.metrics.method = METHOD_DENSITY;
      spdlog::info("HDBSCAN found {} clusters, {} noise points", partition.n_clusters,
                   result.metrics.n_noise);

      NoiseReassigner reassigner(config_.noise_similarity_threshold);
      auto reassigned = reassigner.apply(set.vectors, partition.labels);
      result.metrics.n_reassigned = static_cast<int>(reassigned.n_reassigned);
      partition.labels = std::move(reassigned.labels);

      clusters = clusters_from_labels(partition, set, session);
    }

    SizeLimiter limiter(config_.min_cluster_size, config_.max_cluster_size, kmeans_spec(config_));
    auto limited = limiter.apply(std::move(clusters), set, session);
    result.metrics.n_splits = limited.n_splits;

    compute_centroids(limited.clusters, set, session);
    result.clusters = std::move(limited.clusters);

    std::unordered_set<std::string> clustered;
    for (const auto& cluster : result.clusters) {
      clustered.insert(cluster.member_ids.begin(), cluster.member_ids.end());
      result.metrics.cluster_sizes.push_back(static_cast<int>(cluster.size()));
    }
    for (const auto& id : set.ids) {
      if (!clustered.contains(id)) result.unclustered_ids.push_back(id);
    }
    result.metrics.n_unclustered = static_cast<int>(result.unclustered_ids.size());

    spdlog::info("Clustering finished: {} clusters, {} unclustered of {} items (method: {})",
                 result.clusters.size(), result.metrics.n_unclustered, n, result.metrics.method);
    return result;
  }

  std::expected<ClusteringResult, std::string> TabClusterer::try_cluster(
      std::span<const Embedding> embeddings) const noexcept {
    try {
      return cluster(embeddings);
    } catch (const std::exception& e) {
      spdlog::error("Clustering failed: {}", e.what());
      return std::unexpected(e.what());
    }
  }

  std::vector<ClusterExport> run_clustering_flow(std::span<const Embedding> embeddings,
                                                 const IItemStore& store, IClusterNamer* namer,
                                                 const ClusteringConfig& config) {
    TabClusterer clusterer(config);
    auto result = clusterer.cluster(embeddings);
    if (result.clusters.empty()) {
      return {};
    }

    if (namer != nullptr) {
      auto requests = build_naming_requests(result.clusters, store);
      apply_cluster_names(result.clusters, namer->name_clusters(requests));
    }

    return export_clusters(result.clusters, store);
  }

}  // namespace tabclust
