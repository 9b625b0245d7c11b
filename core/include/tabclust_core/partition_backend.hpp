#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

#include "types.hpp"

namespace tabclust {

  // One label per input row: a cluster index in [0, n_clusters) or kNoiseLabel
  struct PartitionResult {
    std::vector<int> labels;
    int n_clusters = 0;

    [[nodiscard]] size_t noise_count() const noexcept;

    // Row indices of each cluster in ascending row order; index = cluster label
    [[nodiscard]] std::vector<std::vector<Eigen::Index>> groups() const;
  };

  // Hierarchical density-based clustering (HDBSCAN, excess-of-mass selection)
  struct DensitySpec {
    int min_cluster_size = 2;
    int min_samples = 1;
    float cluster_selection_epsilon = 0.05f;
  };

  // k-means with k-means++ seeding and Lloyd iterations
  struct CentroidSpec {
    int n_clusters = 2;
    std::uint32_t random_state = 42;
    int n_init = 10;
    int max_iter = 300;
    float tol = 1e-4f;
  };

  using BackendSpec = std::variant<DensitySpec, CentroidSpec>;

  // Abstract interface for partitioning a set of normalized vectors into labelled groups
  class IPartitionBackend {
  public:
    virtual ~IPartitionBackend() = default;

    // Non-copyable, non-movable (polymorphic base class)
    IPartitionBackend(const IPartitionBackend&) = delete;
    IPartitionBackend& operator=(const IPartitionBackend&) = delete;
    IPartitionBackend(IPartitionBackend&&) = delete;
    IPartitionBackend& operator=(IPartitionBackend&&) = delete;

    // Partition the rows of `points` (n x dim, row-major)
    [[nodiscard]] virtual PartitionResult partition(const EmbeddingMatrix& points) = 0;

    // Short identifier recorded as the `method` of the resulting clusters
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  protected:
    IPartitionBackend() = default;
  };

  // Factory function to create the backend described by `spec`
  [[nodiscard]] std::unique_ptr<IPartitionBackend> create_backend(const BackendSpec& spec);

}  // namespace tabclust
