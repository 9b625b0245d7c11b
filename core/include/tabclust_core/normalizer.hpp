#pragma once
#include <span>
#include <string>
#include <vector>

#include "models.hpp"
#include "types.hpp"

namespace tabclust {

  // Unit-length embeddings in input order, with the id of each row
  struct NormalizedSet {
    std::vector<std::string> ids;
    EmbeddingMatrix vectors;  // Shape: (n_items, dim)
    RowIndex rows;

    [[nodiscard]] Eigen::Index size() const noexcept { return vectors.rows(); }
    [[nodiscard]] Eigen::Index dim() const noexcept { return vectors.cols(); }

    // Rows of `vectors` for the given ids, in the given order
    [[nodiscard]] EmbeddingMatrix gather(std::span<const std::string> member_ids) const;
  };

  // L2-normalize every embedding. Throws InvalidInputError on zero dimension,
  // mismatched dimensions, non-finite components, zero norm or duplicate ids.
  [[nodiscard]] NormalizedSet normalize_embeddings(std::span<const Embedding> embeddings);

  // L2-normalize the rows of a matrix in place (rows must have non-zero norm)
  void normalize_rows(EmbeddingMatrix& matrix);

}  // namespace tabclust
