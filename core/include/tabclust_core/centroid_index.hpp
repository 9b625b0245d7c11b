#pragma once
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <usearch/index.hpp>
#include <usearch/index_dense.hpp>

#include "types.hpp"

namespace tabclust {

  // Nearest-centroid lookup over a small dense set of centroids.
  // Distances are squared Euclidean; ties resolve to the lowest centroid index.
  class CentroidIndex {
  public:
    CentroidIndex() = default;

    // Load cluster centroids (n_clusters x dim matrix in row-major order)
    void load_centroids(const float* data, size_t n_clusters, size_t dim);
    void load_centroids(const EmbeddingMatrix& centroids);

    // Returns (centroid index, squared distance); (-1, 0) when no centroids are loaded
    [[nodiscard]] std::pair<int, float> assign(std::span<const float> embedding) const;

    // One assignment per row of `points`
    [[nodiscard]] std::vector<std::pair<int, float>> assign_batch(
        const EmbeddingMatrix& points) const;

    [[nodiscard]] size_t n_clusters() const noexcept { return static_cast<size_t>(n_clusters_); }
    [[nodiscard]] size_t dim() const noexcept { return static_cast<size_t>(dim_); }

  private:
    std::vector<float> centroids_;
    unum::usearch::metric_punned_t metric_;
    int n_clusters_ = 0;
    int dim_ = 0;
  };

}  // namespace tabclust
