#pragma once
#include <spdlog/spdlog.h>

#include <cstdint>
#include <random>
#include <string>
#include <tabclust_core/models.hpp>
#include <tabclust_core/types.hpp>
#include <vector>

namespace bench_utils {

  // Pipeline stages log at info level; keep benchmark output readable
  inline void SilenceLogs() { spdlog::set_level(spdlog::level::off); }

  // `n_blobs` Gaussian blobs of `per_blob` points around random directions
  inline std::vector<tabclust::Embedding> GenerateBlobs(int n_blobs, int per_blob, int dim,
                                                        float spread = 0.2f,
                                                        uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> normal(0.0f, 1.0f);

    std::vector<tabclust::Embedding> embeddings;
    embeddings.reserve(static_cast<size_t>(n_blobs * per_blob));
    for (int b = 0; b < n_blobs; ++b) {
      std::vector<float> center(static_cast<size_t>(dim));
      for (auto& v : center) v = normal(rng);
      for (int i = 0; i < per_blob; ++i) {
        auto v = center;
        for (auto& x : v) x += spread * normal(rng);
        embeddings.push_back(tabclust::Embedding{
            "tab_" + std::to_string(embeddings.size()), std::move(v), "bench-model"});
      }
    }
    return embeddings;
  }

  inline tabclust::EmbeddingMatrix GenerateMatrix(int rows, int dim, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    tabclust::EmbeddingMatrix m(rows, dim);
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
      for (Eigen::Index j = 0; j < m.cols(); ++j) m(i, j) = dist(rng);
    }
    m.rowwise().normalize();
    return m;
  }

}  // namespace bench_utils
