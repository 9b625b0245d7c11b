#include <algorithm>
#include <tabclust_core/hdbscan.hpp>
#include <tabclust_core/kmeans.hpp>
#include <tabclust_core/partition_backend.hpp>

namespace tabclust {

  size_t PartitionResult::noise_count() const noexcept {
    return static_cast<size_t>(std::count(labels.begin(), labels.end(), kNoiseLabel));
  }

  std::vector<std::vector<Eigen::Index>> PartitionResult::groups() const {
    std::vector<std::vector<Eigen::Index>> out(static_cast<size_t>(std::max(n_clusters, 0)));
    for (size_t i = 0; i < labels.size(); ++i) {
      int label = labels[i];
      if (label >= 0 && label < n_clusters) {
        out[static_cast<size_t>(label)].push_back(static_cast<Eigen::Index>(i));
      }
    }
    return out;
  }

  // =============================================================================
  // Factory Functions
  // =============================================================================

  std::unique_ptr<IPartitionBackend> create_backend(const BackendSpec& spec) {
    return std::visit(overloaded{[](const DensitySpec& density) -> std::unique_ptr<IPartitionBackend> {
                                   return std::make_unique<DensityBackend>(density);
                                 },
                                 [](const CentroidSpec& centroid) -> std::unique_ptr<IPartitionBackend> {
                                   return std::make_unique<KMeansBackend>(centroid);
                                 }},
                      spec);
  }

}  // namespace tabclust
