#include "noted/core/random_source.hpp"

namespace noted::core {

namespace {

void fillFrom(std::mt19937_64& engine, std::span<std::uint8_t> out) {
  std::size_t i = 0;
  while (i < out.size()) {
    std::uint64_t word = engine();
    for (int k = 0; k < 8 && i < out.size(); ++k, ++i) {
      out[i] = static_cast<std::uint8_t>(word & 0xFF);
      word >>= 8;
    }
  }
}

}  // namespace

void SystemRandomSource::fill(std::span<std::uint8_t> out) {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(
      (static_cast<std::uint64_t>(rd()) << 32) | static_cast<std::uint64_t>(rd()));
  fillFrom(gen, out);
}

SeededRandomSource::SeededRandomSource(std::uint64_t seed) : engine_(seed) {}

void SeededRandomSource::fill(std::span<std::uint8_t> out) {
  std::lock_guard<std::mutex> lock(mutex_);
  fillFrom(engine_, out);
}

std::shared_ptr<RandomSource> defaultRandomSource() {
  static const auto source = std::make_shared<SystemRandomSource>();
  return source;
}

}  // namespace noted::core
