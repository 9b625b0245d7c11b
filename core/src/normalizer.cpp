#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tabclust_core/errors.hpp>
#include <tabclust_core/normalizer.hpp>

namespace tabclust {

  EmbeddingMatrix NormalizedSet::gather(std::span<const std::string> member_ids) const {
    EmbeddingMatrix out(static_cast<Eigen::Index>(member_ids.size()), dim());
    for (size_t i = 0; i < member_ids.size(); ++i) {
      auto it = rows.find(member_ids[i]);
      if (it == rows.end()) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Unknown item id: {}", member_ids[i]));
      }
      out.row(static_cast<Eigen::Index>(i)) = vectors.row(it->second);
    }
    return out;
  }

  namespace {

    // Scales row `i` to unit length with the norm accumulated in double precision,
    // so large or tiny float components neither overflow nor underflow.
    // Returns false when the norm is zero or not finite.
    bool normalize_row(EmbeddingMatrix& matrix, Eigen::Index i) {
      const Eigen::RowVectorXd row = matrix.row(i).cast<double>();
      const double norm = row.norm();
      if (!(norm > 0.0) || !std::isfinite(norm)) return false;
      matrix.row(i) = (row / norm).cast<float>();
      return true;
    }

  }  // namespace

  void normalize_rows(EmbeddingMatrix& matrix) {
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
      if (!normalize_row(matrix, i)) {
        throw InvalidInputError(fmt::format("Row {} has zero or non-finite norm", i));
      }
    }
  }

  NormalizedSet normalize_embeddings(std::span<const Embedding> embeddings) {
    NormalizedSet set;
    if (embeddings.empty()) {
      return set;
    }

    const size_t dim = embeddings.front().vector.size();
    if (dim == 0) {
      throw InvalidInputError("Embedding dimensionality must be positive");
    }

    const auto n = static_cast<Eigen::Index>(embeddings.size());
    set.vectors.resize(n, static_cast<Eigen::Index>(dim));
    set.ids.reserve(embeddings.size());
    set.rows.reserve(embeddings.size());

    for (Eigen::Index i = 0; i < n; ++i) {
      const auto& embedding = embeddings[static_cast<size_t>(i)];

      if (embedding.vector.size() != dim) {
        throw InvalidInputError(fmt::format("Embedding dimension mismatch for '{}': expected {}, got {}",
                                            embedding.item_id, dim, embedding.vector.size()));
      }
      if (!set.rows.emplace(embedding.item_id, i).second) {
        throw InvalidInputError(fmt::format("Duplicate item id: {}", embedding.item_id));
      }

      for (size_t col = 0; col < dim; ++col) {
        float value = embedding.vector[col];
        if (!std::isfinite(value)) {
          throw InvalidInputError(fmt::format(
              "Embedding for '{}' has a non-finite component at index {}", embedding.item_id, col));
        }
        set.vectors(i, static_cast<Eigen::Index>(col)) = value;
      }

      if (!normalize_row(set.vectors, i)) {
        throw InvalidInputError(fmt::format("Embedding for '{}' has zero norm", embedding.item_id));
      }
      set.ids.push_back(embedding.item_id);
    }

    spdlog::debug("Normalized {} embeddings of dimension {}", n, dim);
    return set;
  }

}  // namespace tabclust
