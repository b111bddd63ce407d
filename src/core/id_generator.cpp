#include "noted/core/id_generator.hpp"

#include <spdlog/spdlog.h>

namespace noted::core {

IdGenerator::IdGenerator() : source_(defaultRandomSource()) {}

IdGenerator::IdGenerator(std::shared_ptr<RandomSource> source)
    : source_(source ? std::move(source) : defaultRandomSource()) {}

TinyId IdGenerator::generate() {
  TinyId::Bytes bytes{};
  source_->fill(bytes);
  return TinyId(bytes);
}

Result<TinyId> IdGenerator::generateUnique(const std::unordered_set<TinyId>& existing) {
  return generateUnique([&existing](const TinyId& id) { return existing.contains(id); });
}

Result<TinyId> IdGenerator::generateUnique(const std::function<bool(const TinyId&)>& in_use) {
  for (std::size_t attempt = 0; attempt < kMaxAttempts; ++attempt) {
    auto id = generate();
    if (!in_use(id)) {
      return id;
    }
  }

  spdlog::error("No free id after {} attempts", kMaxAttempts);
  return makeErrorResult<TinyId>(ErrorCode::kExhaustedIdSpace,
                                 "No free id found after " + std::to_string(kMaxAttempts) +
                                     " attempts");
}

}  // namespace noted::core
