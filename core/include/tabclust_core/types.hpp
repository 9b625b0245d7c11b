#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace tabclust {

  // Row-major storage so each embedding is contiguous for the distance kernels
  template <typename Scalar>
  using EmbeddingMatrixT = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

  template <typename Scalar> using EmbeddingVectorT = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

  using EmbeddingMatrix = EmbeddingMatrixT<float>;
  using EmbeddingVector = EmbeddingVectorT<float>;

  // Item id -> row in the normalized embedding matrix
  using RowIndex = std::unordered_map<std::string, Eigen::Index>;

  // Label reported for points no cluster claims
  inline constexpr int kNoiseLabel = -1;

  template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
  };

}  // namespace tabclust
