#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <tabclust_core/centroid_index.hpp>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace tabclust {

  void CentroidIndex::load_centroids(const float* data, size_t n_clusters, size_t dim) {
    if (n_clusters == 0 || dim == 0) [[unlikely]] {
      throw std::invalid_argument("n_clusters and dim must be positive");
    }

    if (n_clusters > SIZE_MAX / dim) [[unlikely]] {
      throw std::invalid_argument("n_clusters * dim would overflow");
    }

    size_t total_size = n_clusters * dim;
    if (total_size > SIZE_MAX / sizeof(float)) [[unlikely]] {
      throw std::invalid_argument("allocation size would overflow");
    }

    n_clusters_ = static_cast<int>(n_clusters);
    dim_ = static_cast<int>(dim);

    using namespace unum::usearch;
    metric_ = metric_punned_t(dim, metric_kind_t::l2sq_k, scalar_kind_t::f32_k);

    centroids_.resize(total_size);
    std::memcpy(centroids_.data(), data, centroids_.size() * sizeof(float));
  }

  void CentroidIndex::load_centroids(const EmbeddingMatrix& centroids) {
    load_centroids(centroids.data(), static_cast<size_t>(centroids.rows()),
                   static_cast<size_t>(centroids.cols()));
  }

  std::pair<int, float> CentroidIndex::assign(std::span<const float> embedding) const {
    if (n_clusters_ == 0) return {-1, 0.0f};
    if (embedding.size() != static_cast<size_t>(dim_)) [[unlikely]] {
      throw std::invalid_argument("dimension mismatch in assign");
    }

    const auto* emb_bytes = reinterpret_cast<const unum::usearch::byte_t*>(embedding.data());

    int best_idx = -1;
    float best_dist_sq = std::numeric_limits<float>::max();

    for (int i = 0; i < n_clusters_; ++i) {
      const auto* centroid_bytes
          = reinterpret_cast<const unum::usearch::byte_t*>(centroids_.data() + i * dim_);
      auto dist_sq = static_cast<float>(metric_(emb_bytes, centroid_bytes));

      if (dist_sq < best_dist_sq) {
        best_dist_sq = dist_sq;
        best_idx = i;
      }
    }

    return {best_idx, best_dist_sq};
  }

  std::vector<std::pair<int, float>> CentroidIndex::assign_batch(
      const EmbeddingMatrix& points) const {
    if (n_clusters_ > 0 && points.cols() != static_cast<Eigen::Index>(dim_)) [[unlikely]] {
      throw std::invalid_argument("dimension mismatch in assign_batch");
    }

    const auto count = static_cast<int>(points.rows());
    const auto dim = static_cast<size_t>(points.cols());
    std::vector<std::pair<int, float>> results(static_cast<size_t>(count));

#ifdef _OPENMP
#  pragma omp parallel for schedule(static)
#endif
    for (int i = 0; i < count; ++i) {
      std::span<const float> row(points.data() + static_cast<size_t>(i) * dim, dim);
      results[static_cast<size_t>(i)] = assign(row);
    }

    return results;
  }

}  // namespace tabclust
