#pragma once
#include <string_view>
#include <vector>

#include "partition_backend.hpp"

namespace tabclust {

  // One edge of the condensed cluster hierarchy. `child` is a point index when
  // child_size == 1, otherwise a condensed cluster id (ids start at n_points).
  struct CondensedEdge {
    int parent;
    int child;
    double lambda;
    int child_size;
  };

  // HDBSCAN over Euclidean distance with excess-of-mass selection.
  // The root cluster is never selected; all points may come back as noise.
  class DensityBackend : public IPartitionBackend {
  public:
    explicit DensityBackend(DensitySpec spec);

    [[nodiscard]] PartitionResult partition(const EmbeddingMatrix& points) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "hdbscan"; }

    // Condensed tree of the last partition() call
    [[nodiscard]] const std::vector<CondensedEdge>& condensed_tree() const noexcept {
      return condensed_;
    }

    [[nodiscard]] const DensitySpec& spec() const noexcept { return spec_; }

  private:
    DensitySpec spec_;
    std::vector<CondensedEdge> condensed_;
  };

}  // namespace tabclust
