#pragma once
#include <random>
#include <string_view>

#include "centroid_index.hpp"
#include "partition_backend.hpp"

namespace tabclust {

  // k-means with k-means++ seeding, Lloyd iterations and `n_init` seeded restarts.
  // The restart with the lowest inertia wins; earlier restarts win ties.
  class KMeansBackend : public IPartitionBackend {
  public:
    explicit KMeansBackend(CentroidSpec spec);

    // Throws std::invalid_argument when there are fewer points than clusters
    [[nodiscard]] PartitionResult partition(const EmbeddingMatrix& points) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "kmeans"; }

    // State of the winning restart from the last partition() call
    [[nodiscard]] const EmbeddingMatrix& centroids() const noexcept { return centroids_; }
    [[nodiscard]] double inertia() const noexcept { return inertia_; }
    [[nodiscard]] int n_iter() const noexcept { return n_iter_; }

    [[nodiscard]] const CentroidSpec& spec() const noexcept { return spec_; }

  private:
    struct RunResult {
      std::vector<int> labels;
      EmbeddingMatrix centers;
      double inertia = 0.0;
      int n_iter = 0;
    };

    [[nodiscard]] EmbeddingMatrix seed_plus_plus(const EmbeddingMatrix& points,
                                                 std::mt19937& rng) const;
    [[nodiscard]] RunResult lloyd(const EmbeddingMatrix& points, EmbeddingMatrix centers,
                                  double tol_sq) const;

    CentroidSpec spec_;
    EmbeddingMatrix centroids_;
    double inertia_ = 0.0;
    int n_iter_ = 0;
  };

}  // namespace tabclust
