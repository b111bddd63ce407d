#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <span>

namespace noted::core {

// Source of raw random bytes for id generation. Implementations must be
// safe to call from several threads at once.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Fill the buffer with random bytes
  virtual void fill(std::span<std::uint8_t> out) = 0;
};

// Thread-local std::mt19937_64 per calling thread, seeded from std::random_device
class SystemRandomSource : public RandomSource {
 public:
  void fill(std::span<std::uint8_t> out) override;
};

// Deterministic source for reproducible sequences
class SeededRandomSource : public RandomSource {
 public:
  explicit SeededRandomSource(std::uint64_t seed);

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// Process-wide system source shared by default-constructed generators
std::shared_ptr<RandomSource> defaultRandomSource();

}  // namespace noted::core
