#pragma once
#include <cstddef>
#include <span>
#include <vector>

#include "types.hpp"

namespace tabclust {

  struct ReassignmentResult {
    std::vector<int> labels;
    size_t n_reassigned = 0;
  };

  // Moves each noise point to the label of its most cosine-similar clustered point
  // when that similarity strictly exceeds the threshold. Single pass: points
  // reassigned here never serve as targets for other noise points.
  class NoiseReassigner {
  public:
    explicit NoiseReassigner(double similarity_threshold)
        : similarity_threshold_(similarity_threshold) {}

    // `points` must be L2-normalized so the dot product is the cosine similarity.
    // Similarities are accumulated in double precision.
    [[nodiscard]] ReassignmentResult apply(const EmbeddingMatrix& points,
                                           std::span<const int> labels) const;

    [[nodiscard]] double similarity_threshold() const noexcept { return similarity_threshold_; }

  private:
    double similarity_threshold_;
  };

}  // namespace tabclust
