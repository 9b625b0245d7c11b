#pragma once
#include <stdexcept>
#include <string>

namespace tabclust {

  // Malformed, empty or mismatched embeddings and invalid configuration.
  // Never retried; always propagated to the caller.
  class InvalidInputError : public std::invalid_argument {
  public:
    explicit InvalidInputError(const std::string& message) : std::invalid_argument(message) {}
  };

}  // namespace tabclust
