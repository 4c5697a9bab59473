#include <gtest/gtest.h>
#include <foxess/envelope.hpp>
#include <foxess/types.hpp>

#include <string>
#include <vector>

using foxess::decode_envelope;
using foxess::unwrap;
using json = nlohmann::json;

TEST(Envelope, SuccessReturnsResult) {
  auto env = decode_envelope<std::string>(
      json::parse(R"({"errno":0,"msg":"success","result":"X"})"));
  EXPECT_EQ(env.error_code, 0);
  EXPECT_EQ(unwrap(env), "X");
}

TEST(Envelope, SuccessWithoutResultIsMissingResult) {
  auto env = decode_envelope<std::string>(json::parse(R"({"errno":0})"));
  EXPECT_THROW(unwrap(env), foxess::MissingResultError);

  auto null_env =
      decode_envelope<std::string>(json::parse(R"({"errno":0,"result":null})"));
  EXPECT_THROW(unwrap(null_env), foxess::MissingResultError);
}

TEST(Envelope, NonZeroCodeIsServerErrorRegardlessOfResult) {
  for (const char *src : {R"({"errno":7,"result":"X"})", R"({"errno":7})",
                          // result не того типа не должен давать DecodeError
                          R"({"errno":7,"result":{"unexpected":true}})"}) {
    auto env = decode_envelope<std::string>(json::parse(src));
    try {
      unwrap(env);
      FAIL() << "expected ServerError for " << src;
    } catch (const foxess::ServerError &e) {
      EXPECT_EQ(e.code(), 7);
    }
  }
}

TEST(Envelope, NegativeCodeIsAlsoFailure) {
  auto env = decode_envelope<int>(json::parse(R"({"errno":-1,"result":5})"));
  EXPECT_THROW(unwrap(env), foxess::ServerError);
}

TEST(Envelope, WideCodeIsNotNarrowedToSuccess) {
  // 2^32 в int превратился бы в 0
  auto env = decode_envelope<int>(
      json::parse(R"({"errno":4294967296,"result":5})"));
  EXPECT_EQ(env.error_code, 4294967296LL);
  EXPECT_FALSE(env.result.has_value());
  try {
    unwrap(env);
    FAIL() << "expected ServerError";
  } catch (const foxess::ServerError &e) {
    EXPECT_EQ(e.code(), 4294967296LL);
  }

  auto huge = decode_envelope<int>(
      json::parse(R"({"errno":18446744073709551615,"result":5})"));
  EXPECT_NE(huge.error_code, 0);
  EXPECT_THROW(unwrap(huge), foxess::ServerError);
}

TEST(Envelope, ShapeMismatchIsDecodeError) {
  EXPECT_THROW(decode_envelope<int>(json::parse("[1,2,3]")),
               foxess::DecodeError);
  EXPECT_THROW(decode_envelope<int>(json::parse(R"({"result":1})")),
               foxess::DecodeError);
  EXPECT_THROW(decode_envelope<int>(json::parse(R"({"errno":"0"})")),
               foxess::DecodeError);
  EXPECT_THROW(
      decode_envelope<std::vector<foxess::RealtimeBlock>>(
          json::parse(R"({"errno":0,"result":{"deviceSN":"A"}})")),
      foxess::DecodeError);
}

TEST(Envelope, ErrorsShareBaseClass) {
  auto env = decode_envelope<int>(json::parse(R"({"errno":40256})"));
  EXPECT_THROW(unwrap(env), foxess::ApiError);
}
