#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "noted/core/random_source.hpp"
#include "noted/core/tiny_id.hpp"

namespace noted::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Write `content` to `name` inside the temporary directory
  std::filesystem::path createFile(const std::string& name, const std::string& content = "");

  std::filesystem::path temp_dir_;
};

// Minimal note-like record used to exercise snapshots
struct TestRecord {
  noted::core::TinyId id;
  std::string title;
  std::vector<std::string> tags;
  double weight = 0.0;

  bool operator==(const TestRecord& other) const = default;
};

void to_json(nlohmann::json& j, const TestRecord& record);
void from_json(const nlohmann::json& j, TestRecord& record);

// Random source that cycles through a fixed set of payloads, giving an
// id space of exactly `distinct` values
class CyclingRandomSource : public noted::core::RandomSource {
 public:
  explicit CyclingRandomSource(std::uint8_t distinct) : distinct_(distinct) {}

  void fill(std::span<std::uint8_t> out) override;

  std::size_t draws() const { return draws_; }

 private:
  std::uint8_t distinct_;
  std::size_t draws_ = 0;
};

// Id whose payload is all zero except for the last byte
noted::core::TinyId idWithLastByte(std::uint8_t value);

// Generate random string for testing
std::string randomString(size_t length);

// Read a whole file as bytes
std::string readAll(const std::filesystem::path& path);

// Number of entries in a directory
std::size_t countEntries(const std::filesystem::path& dir);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code) << r.error().message();                           \
    }                                                                                              \
  } while (0)

}  // namespace noted::test
