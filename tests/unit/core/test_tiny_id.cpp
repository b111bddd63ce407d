#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "noted/core/id_generator.hpp"
#include "noted/core/random_source.hpp"
#include "noted/core/tiny_id.hpp"
#include "test_helpers.hpp"

using namespace noted::core;
using namespace noted::test;
using noted::ErrorCode;

class TinyIdTest : public ::testing::Test {};

TEST_F(TinyIdTest, AlphabetHasNoLookAlikes) {
  auto alphabet = TinyId::alphabet();

  EXPECT_EQ(alphabet.size(), 32u);
  for (char c : std::string("0O1lIoi")) {
    EXPECT_EQ(alphabet.find(c), std::string_view::npos) << "found " << c;
  }
  EXPECT_TRUE(std::is_sorted(alphabet.begin(), alphabet.end()));
  EXPECT_EQ(std::set<char>(alphabet.begin(), alphabet.end()).size(), alphabet.size());
}

TEST_F(TinyIdTest, EncodedLength) {
  EXPECT_EQ(TinyId::kEncodedLength, 12u);

  IdGenerator generator(std::make_shared<SeededRandomSource>(7));
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(generator.generate().toString().length(), TinyId::kEncodedLength);
  }
}

TEST_F(TinyIdTest, AllZeroPayload) {
  TinyId zero;
  EXPECT_TRUE(zero.isNull());
  EXPECT_EQ(zero, TinyId::null());

  std::string expected(TinyId::kEncodedLength, TinyId::alphabet()[0]);
  EXPECT_EQ(zero.toString(), expected);

  auto decoded = TinyId::fromString(expected);
  ASSERT_OK(decoded);
  EXPECT_EQ(*decoded, zero);
  EXPECT_TRUE(decoded->isNull());
}

TEST_F(TinyIdTest, KnownVectors) {
  TinyId::Bytes ones;
  ones.fill(0xFF);
  // 56 one bits then 4 zero padding bits
  EXPECT_EQ(TinyId(ones).toString(), "zzzzzzzzzzzJ");

  EXPECT_EQ(idWithLastByte(1).toString(), "22222222222J");
  EXPECT_EQ(idWithLastByte(2).toString(), "222222222232");
}

TEST_F(TinyIdTest, RoundTripRandom) {
  IdGenerator generator(std::make_shared<SeededRandomSource>(42));

  for (int i = 0; i < 10000; ++i) {
    auto id = generator.generate();
    auto decoded = TinyId::fromString(id.toString());
    ASSERT_OK(decoded);
    EXPECT_EQ(*decoded, id);
  }
}

TEST_F(TinyIdTest, FromStringInvalidLength) {
  EXPECT_ERROR(TinyId::fromString(""), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("2222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("22222222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("2222222222222"), ErrorCode::kInvalidIdFormat);
}

TEST_F(TinyIdTest, FromStringInvalidCharacters) {
  // Look-alikes
  EXPECT_ERROR(TinyId::fromString("22222222222O"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("022222222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("122222222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("l22222222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("I22222222222"), ErrorCode::kInvalidIdFormat);

  // Wrong case
  EXPECT_ERROR(TinyId::fromString("a22222222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("Z22222222222"), ErrorCode::kInvalidIdFormat);

  // Punctuation, whitespace, control and non-ASCII bytes
  EXPECT_ERROR(TinyId::fromString("2222-2222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("22222222222 "), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString(std::string("22222") + '\0' + "222222"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("2222222222\xC3\xA9"), ErrorCode::kInvalidIdFormat);
}

TEST_F(TinyIdTest, FromStringRejectsNonCanonicalPadding) {
  // Final character may only carry one payload bit
  EXPECT_ERROR(TinyId::fromString("222222222223"), ErrorCode::kInvalidIdFormat);
  EXPECT_ERROR(TinyId::fromString("22222222222z"), ErrorCode::kInvalidIdFormat);
  EXPECT_OK(TinyId::fromString("22222222222J"));
}

TEST_F(TinyIdTest, ArbitraryInputNeverThrows) {
  SeededRandomSource source(1234);
  std::vector<std::uint8_t> buffer(TinyId::kEncodedLength);

  for (int i = 0; i < 5000; ++i) {
    source.fill(buffer);
    std::string input(buffer.begin(), buffer.end());
    EXPECT_NO_THROW({
      auto result = TinyId::fromString(input);
      if (result.has_value()) {
        EXPECT_EQ(result->toString(), input);
      }
    });
  }
}

TEST_F(TinyIdTest, FromBytes) {
  std::vector<std::uint8_t> raw = {1, 2, 3, 4, 5, 6, 7};
  auto id = TinyId::fromBytes(raw);
  ASSERT_OK(id);
  EXPECT_TRUE(std::equal(raw.begin(), raw.end(), id->bytes().begin()));

  std::vector<std::uint8_t> short_raw = {1, 2, 3};
  EXPECT_ERROR(TinyId::fromBytes(short_raw), ErrorCode::kInvalidIdFormat);
}

TEST_F(TinyIdTest, CompareUsesBytes) {
  auto a = idWithLastByte(1);
  auto b = idWithLastByte(2);

  EXPECT_EQ(compare(a, b), std::strong_ordering::less);
  EXPECT_EQ(compare(b, a), std::strong_ordering::greater);
  EXPECT_EQ(compare(a, a), std::strong_ordering::equal);
  EXPECT_LT(a, b);
  EXPECT_LE(a, a);
  EXPECT_GT(b, a);
  EXPECT_NE(a, b);

  TinyId::Bytes high{};
  high[0] = 0x01;
  EXPECT_LT(b, TinyId(high));
}

TEST_F(TinyIdTest, SortingByCompareIsStable) {
  IdGenerator generator(std::make_shared<SeededRandomSource>(99));
  std::vector<TinyId> ids;
  for (int i = 0; i < 200; ++i) {
    ids.push_back(generator.generate());
  }

  std::sort(ids.begin(), ids.end(),
            [](const TinyId& a, const TinyId& b) { return compare(a, b) < 0; });
  for (size_t i = 1; i < ids.size(); ++i) {
    EXPECT_LT(ids[i - 1].bytes(), ids[i].bytes());
  }
}

TEST_F(TinyIdTest, UnorderedMapUsage) {
  std::unordered_map<TinyId, std::string> map;

  auto id1 = idWithLastByte(1);
  auto id2 = idWithLastByte(2);

  map[id1] = "note1";
  map[id2] = "note2";

  EXPECT_EQ(map[id1], "note1");
  EXPECT_EQ(map[id2], "note2");
  EXPECT_EQ(map.size(), 2u);
}

TEST_F(TinyIdTest, JsonConversion) {
  auto id = idWithLastByte(200);

  nlohmann::json j = id;
  EXPECT_EQ(j.get<std::string>(), id.toString());
  EXPECT_EQ(j.get<TinyId>(), id);

  nlohmann::json bad = "not-an-id";
  EXPECT_THROW(bad.get<TinyId>(), std::invalid_argument);

  nlohmann::json wrong_type = 42;
  EXPECT_THROW(wrong_type.get<TinyId>(), nlohmann::json::exception);
}
