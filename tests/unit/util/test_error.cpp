/**
 * @file test_error.cpp
 * @brief Unit tests for Error and Result helpers
 */

#include <gtest/gtest.h>

#include <cerrno>
#include <string>

#include "shade/util/Error.hpp"

using namespace SHADE::Util;

TEST(ErrorTest, CarriesCodeMessageAndTimestamp) {
  Error error(Error::INVALID_CONFIG, "bad value");

  EXPECT_EQ(error.code, Error::INVALID_CONFIG);
  EXPECT_EQ(error.message, "bad value");
  EXPECT_FALSE(error.timestamp.empty());
  EXPECT_FALSE(error.system_errno.has_value());
}

TEST(ErrorTest, SystemErrnoIsAppendedToMessage) {
  Error error(Error::CONFIG_NOT_FOUND, "open failed", ENOENT);

  ASSERT_TRUE(error.system_errno.has_value());
  EXPECT_EQ(*error.system_errno, ENOENT);
  EXPECT_NE(error.message.find("errno: " + std::to_string(ENOENT)),
            std::string::npos);
}

TEST(ErrorTest, CodeNamesAreStable) {
  EXPECT_STREQ(Error::codeToString(Error::INTROSPECTION_UNSUPPORTED),
               "INTROSPECTION_UNSUPPORTED");
  EXPECT_STREQ(Error::codeToString(Error::INTROSPECTION_FAILED), "INTROSPECTION_FAILED");
}

TEST(ResultTest, OkHoldsValue) {
  auto result = Ok(42);

  ASSERT_TRUE(isOk(result));
  EXPECT_EQ(getValue(result), 42);
}

TEST(ResultTest, ErrHoldsError) {
  auto result = Err<int>(Error(Error::INTROSPECTION_FAILED, "tree read failed"));

  ASSERT_FALSE(isOk(result));
  EXPECT_EQ(getError(result).code, Error::INTROSPECTION_FAILED);
}

TEST(ResultTest, TakeValueMovesOut) {
  auto result = Ok(std::string("snapshot"));

  std::string value = takeValue(std::move(result));
  EXPECT_EQ(value, "snapshot");
}
