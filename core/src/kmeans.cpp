#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tabclust_core/kmeans.hpp>

namespace tabclust {

  namespace {

    // tol scaled by the mean per-feature variance of the data
    double scaled_tolerance(const EmbeddingMatrix& points, float tol) {
      if (tol <= 0.0f || points.rows() == 0) return 0.0;
      const Eigen::MatrixXd p = points.cast<double>();
      Eigen::RowVectorXd mean = p.colwise().mean();
      double variance_sum = (p.rowwise() - mean).array().square().colwise().mean().sum();
      return static_cast<double>(tol) * variance_sum / static_cast<double>(p.cols());
    }

    double squared_distance(const EmbeddingMatrix& points, Eigen::Index a, Eigen::Index b) {
      return static_cast<double>((points.row(a) - points.row(b)).squaredNorm());
    }

  }  // namespace

  KMeansBackend::KMeansBackend(CentroidSpec spec) : spec_(spec) {
    if (spec_.n_clusters < 1) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("n_clusters must be positive, got {}", spec_.n_clusters));
    }
    if (spec_.n_init < 1 || spec_.max_iter < 1) [[unlikely]] {
      throw std::invalid_argument("n_init and max_iter must be positive");
    }
  }

  // Greedy k-means++: each new center is the best of 2 + ln(k) candidates sampled
  // proportionally to the current squared-distance potential
  EmbeddingMatrix KMeansBackend::seed_plus_plus(const EmbeddingMatrix& points,
                                                std::mt19937& rng) const {
    const Eigen::Index n = points.rows();
    const int k = spec_.n_clusters;
    const int n_local_trials = 2 + static_cast<int>(std::log(static_cast<double>(k)));

    EmbeddingMatrix centers(k, points.cols());
    std::uniform_int_distribution<Eigen::Index> pick_any(0, n - 1);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    Eigen::Index first = pick_any(rng);
    centers.row(0) = points.row(first);

    std::vector<double> closest(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
      closest[static_cast<size_t>(i)] = squared_distance(points, i, first);
    }
    double potential = std::accumulate(closest.begin(), closest.end(), 0.0);

    std::vector<double> cumulative(static_cast<size_t>(n));
    std::vector<double> candidate_closest(static_cast<size_t>(n));
    std::vector<double> best_closest(static_cast<size_t>(n));

    for (int c = 1; c < k; ++c) {
      std::partial_sum(closest.begin(), closest.end(), cumulative.begin());

      Eigen::Index best_candidate = -1;
      double best_potential = 0.0;

      for (int t = 0; t < n_local_trials; ++t) {
        Eigen::Index candidate;
        if (potential > 0.0) {
          double r = unit(rng) * potential;
          auto it = std::lower_bound(cumulative.begin(), cumulative.end(), r);
          candidate = std::min<Eigen::Index>(it - cumulative.begin(), n - 1);
        } else {
          candidate = pick_any(rng);
        }

        double candidate_potential = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
          auto ui = static_cast<size_t>(i);
          candidate_closest[ui] = std::min(closest[ui], squared_distance(points, i, candidate));
          candidate_potential += candidate_closest[ui];
        }

        if (best_candidate == -1 || candidate_potential < best_potential) {
          best_candidate = candidate;
          best_potential = candidate_potential;
          best_closest.swap(candidate_closest);
        }
      }

      centers.row(c) = points.row(best_candidate);
      closest.swap(best_closest);
      potential = best_potential;
    }

    return centers;
  }

  KMeansBackend::RunResult KMeansBackend::lloyd(const EmbeddingMatrix& points,
                                                EmbeddingMatrix centers, double tol_sq) const {
    const Eigen::Index n = points.rows();
    const int k = spec_.n_clusters;

    CentroidIndex index;
    std::vector<int> labels(static_cast<size_t>(n), -1);
    int iter = 0;

    for (; iter < spec_.max_iter; ++iter) {
      index.load_centroids(centers);
      auto assignment = index.assign_batch(points);

      bool changed = false;
      for (Eigen::Index i = 0; i < n; ++i) {
        auto ui = static_cast<size_t>(i);
        if (assignment[ui].first != labels[ui]) {
          labels[ui] = assignment[ui].first;
          changed = true;
        }
      }
      if (!changed) break;

      EmbeddingMatrix updated = EmbeddingMatrix::Zero(k, points.cols());
      std::vector<int> counts(static_cast<size_t>(k), 0);
      for (Eigen::Index i = 0; i < n; ++i) {
        int label = labels[static_cast<size_t>(i)];
        updated.row(label) += points.row(i);
        ++counts[static_cast<size_t>(label)];
      }

      // Empty clusters take the points farthest from their current center
      std::vector<Eigen::Index> farthest;
      size_t next_far = 0;
      for (int c = 0; c < k; ++c) {
        if (counts[static_cast<size_t>(c)] > 0) {
          updated.row(c) /= static_cast<float>(counts[static_cast<size_t>(c)]);
          continue;
        }
        if (farthest.empty()) {
          farthest.resize(static_cast<size_t>(n));
          std::iota(farthest.begin(), farthest.end(), 0);
          std::stable_sort(farthest.begin(), farthest.end(), [&](Eigen::Index a, Eigen::Index b) {
            return assignment[static_cast<size_t>(a)].second
                   > assignment[static_cast<size_t>(b)].second;
          });
        }
        updated.row(c) = points.row(farthest[std::min(next_far++, farthest.size() - 1)]);
      }

      double shift = static_cast<double>((updated - centers).squaredNorm());
      centers = std::move(updated);
      if (shift <= tol_sq) {
        ++iter;
        break;
      }
    }

    index.load_centroids(centers);
    auto assignment = index.assign_batch(points);

    RunResult run;
    run.labels.resize(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
      auto ui = static_cast<size_t>(i);
      run.labels[ui] = assignment[ui].first;
      run.inertia += static_cast<double>(assignment[ui].second);
    }
    run.centers = std::move(centers);
    run.n_iter = iter;
    return run;
  }

  PartitionResult KMeansBackend::partition(const EmbeddingMatrix& points) {
    const Eigen::Index n = points.rows();
    if (n < spec_.n_clusters) {
      throw std::invalid_argument(
          fmt::format("n_samples={} should be >= n_clusters={}", n, spec_.n_clusters));
    }

    std::mt19937 rng(spec_.random_state);
    const double tol_sq = scaled_tolerance(points, spec_.tol);

    RunResult best;
    bool have_best = false;
    for (int run = 0; run < spec_.n_init; ++run) {
      auto result = lloyd(points, seed_plus_plus(points, rng), tol_sq);
      if (!have_best || result.inertia < best.inertia) {
        best = std::move(result);
        have_best = true;
      }
    }

    centroids_ = std::move(best.centers);
    inertia_ = best.inertia;
    n_iter_ = best.n_iter;

    spdlog::debug("k-means: k={}, n={}, inertia={:.6f}, iterations={}", spec_.n_clusters, n,
                  inertia_, n_iter_);

    PartitionResult result;
    result.labels = std::move(best.labels);
    result.n_clusters = spec_.n_clusters;
    return result;
  }

}  // namespace tabclust
