#include "spill/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <stdexcept>
#include <string>
#include <vector>

// Test fixture for ErrorHandling tests
class ErrorHandlingTest : public ::testing::Test {};

TEST_F(ErrorHandlingTest, TestSpillExceptionConstruction) {
  spill::SpillException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
}

TEST_F(ErrorHandlingTest, TestThrowError) {
  EXPECT_THROW(spill::throwError("Test error message"), spill::SpillException);

  try {
    spill::throwError("Invalid range");
  } catch (const spill::SpillException &e) {
    EXPECT_STREQ("Invalid range", e.what());
  }
}

// ErrorCode tests

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::Ok), "Ok");
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::ResourceExhausted), "ResourceExhausted");
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::InvalidArgument), "InvalidArgument");
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::ParseError), "ParseError");
  EXPECT_EQ(spill::errorCodeToString(spill::ErrorCode::Internal), "Internal");
}

// Result<T> tests

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = spill::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), spill::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = spill::Result<int>::error(spill::ErrorCode::NotFound, "missing");
  EXPECT_FALSE(r.isOk());
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), spill::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsOnError) {
  auto r = spill::Result<int>::error(spill::ErrorCode::Internal, "broken");
  EXPECT_THROW(r.value(), spill::SpillException);
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = spill::Result<int>::ok(10);
  EXPECT_EQ(ok.valueOr(99), 10);

  auto err = spill::Result<int>::error(spill::ErrorCode::ResourceExhausted);
  EXPECT_EQ(err.valueOr(99), 99);
}

TEST_F(ErrorHandlingTest, ResultPointerPayload) {
  int slot = 7;
  auto r = spill::Result<int *>::ok(&slot);
  ASSERT_TRUE(r.isOk());
  EXPECT_EQ(*r.value(), 7);
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = spill::Result<std::vector<int>>::ok({1, 2, 3});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
}

// Result<void> tests

TEST_F(ErrorHandlingTest, ResultVoidOk) {
  auto r = spill::Result<void>::ok();
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), spill::ErrorCode::Ok);
}

TEST_F(ErrorHandlingTest, ResultVoidError) {
  auto r = spill::Result<void>::error(spill::ErrorCode::InvalidArgument, "nope");
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), spill::ErrorCode::InvalidArgument);
  EXPECT_EQ(r.message(), "nope");
}
