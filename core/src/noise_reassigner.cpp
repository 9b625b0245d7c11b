#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tabclust_core/noise_reassigner.hpp>

namespace tabclust {

  ReassignmentResult NoiseReassigner::apply(const EmbeddingMatrix& points,
                                            std::span<const int> labels) const {
    if (labels.size() != static_cast<size_t>(points.rows())) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("labels size ({}) does not match number of points ({})", labels.size(),
                      points.rows()));
    }

    ReassignmentResult result;
    result.labels.assign(labels.begin(), labels.end());

    std::vector<Eigen::Index> clustered;
    std::vector<Eigen::Index> noise;
    for (size_t i = 0; i < labels.size(); ++i) {
      (labels[i] == kNoiseLabel ? noise : clustered).push_back(static_cast<Eigen::Index>(i));
    }
    if (noise.empty() || clustered.empty()) return result;

    for (Eigen::Index i : noise) {
      const Eigen::RowVectorXd point = points.row(i).cast<double>();
      Eigen::Index best = -1;
      double best_similarity = 0.0;

      for (Eigen::Index j : clustered) {
        double similarity = point.dot(points.row(j).cast<double>());
        if (best == -1 || similarity > best_similarity) {
          best_similarity = similarity;
          best = j;
        }
      }

      if (best_similarity > similarity_threshold_) {
        result.labels[static_cast<size_t>(i)] = labels[static_cast<size_t>(best)];
        ++result.n_reassigned;
      }
    }

    spdlog::info("Reassigned {} of {} noise points (threshold {:.2f})", result.n_reassigned,
                 noise.size(), similarity_threshold_);
    return result;
  }

}  // namespace tabclust
