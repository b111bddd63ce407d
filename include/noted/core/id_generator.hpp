#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_set>

#include "noted/common.hpp"
#include "noted/core/random_source.hpp"
#include "noted/core/tiny_id.hpp"

namespace noted::core {

// Produces TinyIds from an injected random source
class IdGenerator {
 public:
  // Number of draws generateUnique makes before giving up
  static constexpr std::size_t kMaxAttempts = 100;

  // Uses the process-wide system source
  IdGenerator();

  explicit IdGenerator(std::shared_ptr<RandomSource> source);

  // Draw a random id. Uniqueness is probabilistic only.
  TinyId generate();

  // Draw ids until one is not in `existing`; kExhaustedIdSpace after
  // kMaxAttempts misses
  Result<TinyId> generateUnique(const std::unordered_set<TinyId>& existing);

  // Same, with membership decided by `in_use`
  Result<TinyId> generateUnique(const std::function<bool(const TinyId&)>& in_use);

 private:
  std::shared_ptr<RandomSource> source_;
};

}  // namespace noted::core
