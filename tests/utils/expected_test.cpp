/**
 * @file expected_test.cpp
 * @brief Unit tests for Expected<T, E> class
 */

#include "utils/expected.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "utils/error.h"

using namespace stashd::utils;

// ========== Test Expected<T, E> with value ==========

TEST(ExpectedTest, DefaultConstructor) {
  Expected<int, Error> result;
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 0);  // Default-constructed int is 0
}

TEST(ExpectedTest, ValueConstructor) {
  Expected<int, Error> result(42);
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(result.value(), 42);
}

TEST(ExpectedTest, ErrorConstructor) {
  auto error = MakeError(ErrorCode::kInvalidArgument, "Test error");
  Expected<int, Error> result(MakeUnexpected(error));
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(result.error().message(), "Test error");
}

TEST(ExpectedTest, BoolConversion) {
  Expected<int, Error> success(42);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_TRUE(static_cast<bool>(success));
  EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ExpectedTest, ValueAccess) {
  Expected<std::string, Error> result("Hello");
  EXPECT_EQ(result.value(), "Hello");
  EXPECT_EQ(*result, "Hello");
  EXPECT_EQ(result->length(), 5);
}

TEST(ExpectedTest, ValueAccessThrows) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  EXPECT_THROW({ (void)result.value(); }, BadExpectedAccess<Error>);
}

TEST(ExpectedTest, ErrorAccess) {
  auto error = MakeError(ErrorCode::kTimeout, "Operation timed out");
  Expected<int, Error> result(MakeUnexpected(error));

  EXPECT_EQ(result.error().code(), ErrorCode::kTimeout);
  EXPECT_EQ(result.error().message(), "Operation timed out");
}

TEST(ExpectedTest, ValueOr) {
  Expected<int, Error> success(42);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_EQ(success.value_or(0), 42);
  EXPECT_EQ(failure.value_or(99), 99);
}

TEST(ExpectedTest, ValueOrMove) {
  Expected<std::string, Error> success("Hello");
  Expected<std::string, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_EQ(std::move(success).value_or("Default"), "Hello");
  EXPECT_EQ(std::move(failure).value_or("Default"), "Default");
}

// ========== Test Expected<void, E> ==========

TEST(ExpectedVoidTest, DefaultConstructor) {
  Expected<void, Error> result;
  EXPECT_TRUE(result.has_value());
}

TEST(ExpectedVoidTest, ErrorConstructor) {
  auto error = MakeError(ErrorCode::kInvalidArgument);
  Expected<void, Error> result(MakeUnexpected(error));
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedVoidTest, ValueAccess) {
  Expected<void, Error> success;
  EXPECT_NO_THROW(success.value());

  Expected<void, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));
  EXPECT_THROW(failure.value(), BadExpectedAccess<Error>);
}

// ========== Test monadic operations ==========

TEST(ExpectedTest, Transform) {
  Expected<int, Error> result(42);

  auto doubled = result.transform([](int x) { return x * 2; });
  EXPECT_TRUE(doubled.has_value());
  EXPECT_EQ(*doubled, 84);

  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kUnknown)));
  auto transformed = error.transform([](int x) { return x * 2; });
  EXPECT_FALSE(transformed.has_value());
}

TEST(ExpectedTest, TransformToString) {
  Expected<int, Error> result(42);

  auto str = result.transform([](int x) { return std::to_string(x); });
  EXPECT_TRUE(str.has_value());
  EXPECT_EQ(*str, "42");
}

TEST(ExpectedTest, AndThen) {
  auto divide = [](int a, int b) -> Expected<int, Error> {
    if (b == 0) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Division by zero"));
    }
    return a / b;
  };

  Expected<int, Error> numerator(10);

  auto result = numerator.and_then([&](int a) { return divide(a, 2); });
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 5);

  auto error_result = numerator.and_then([&](int a) { return divide(a, 0); });
  EXPECT_FALSE(error_result.has_value());
  EXPECT_EQ(error_result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedTest, OrElse) {
  auto recover = [](const Error& err) -> Expected<int, Error> {
    if (err.code() == ErrorCode::kNotFound) {
      return 0;  // Return default value
    }
    return MakeUnexpected(err);  // Propagate other errors
  };

  Expected<int, Error> not_found(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  auto recovered = not_found.or_else(recover);
  EXPECT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 0);

  Expected<int, Error> other_error(MakeUnexpected(MakeError(ErrorCode::kTimeout)));
  auto not_recovered = other_error.or_else(recover);
  EXPECT_FALSE(not_recovered.has_value());
  EXPECT_EQ(not_recovered.error().code(), ErrorCode::kTimeout);
}

TEST(ExpectedTest, TransformError) {
  auto add_context = [](const Error& err) { return MakeError(err.code(), err.message(), "Additional context"); };

  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kTimeout, "Operation timed out")));
  auto with_context = error.transform_error(add_context);

  EXPECT_FALSE(with_context.has_value());
  EXPECT_EQ(with_context.error().code(), ErrorCode::kTimeout);
  EXPECT_EQ(with_context.error().context(), "Additional context");
}

// ========== Test copy and move semantics ==========

TEST(ExpectedTest, CopyConstructor) {
  Expected<std::string, Error> original("Hello");
  Expected<std::string, Error> copy(original);

  EXPECT_TRUE(copy.has_value());
  EXPECT_EQ(*copy, "Hello");
  EXPECT_EQ(*original, "Hello");  // Original unchanged
}

TEST(ExpectedTest, MoveConstructor) {
  Expected<std::string, Error> original("Hello");
  Expected<std::string, Error> moved(std::move(original));

  EXPECT_TRUE(moved.has_value());
  EXPECT_EQ(*moved, "Hello");
}

TEST(ExpectedTest, CopyAssignment) {
  Expected<int, Error> original(42);
  Expected<int, Error> copy(0);
  copy = original;

  EXPECT_TRUE(copy.has_value());
  EXPECT_EQ(*copy, 42);
}

TEST(ExpectedTest, MoveAssignment) {
  Expected<std::string, Error> original("Hello");
  Expected<std::string, Error> moved("World");
  moved = std::move(original);

  EXPECT_TRUE(moved.has_value());
  EXPECT_EQ(*moved, "Hello");
}

// ========== Error rendering ==========

TEST(ErrorTest, ToString) {
  EXPECT_EQ(MakeError(ErrorCode::kInvalidArgument).to_string(), "InvalidArgument");
  EXPECT_EQ(MakeError(ErrorCode::kBackupLengthMismatch, "expected 10 actual 9").to_string(),
            "BackupLengthMismatch: expected 10 actual 9");
  EXPECT_EQ(MakeError(ErrorCode::kRetriesExhausted, "gave up", "offset 4096").to_string(),
            "RetriesExhausted: gave up (offset 4096)");
}

TEST(ErrorTest, WithContextKeepsCodeAndMessage) {
  auto original = MakeError(ErrorCode::kMigrationError, "Migration error. Tag 3 Error: bad", "inner");
  auto wrapped = WithContext(original, "backup.bin");

  EXPECT_EQ(wrapped.code(), ErrorCode::kMigrationError);
  EXPECT_EQ(wrapped.message(), original.message());
  EXPECT_EQ(wrapped.context(), "backup.bin");
  EXPECT_NE(wrapped, original);
}

TEST(ErrorTest, DefaultIsSuccess) {
  Error error;
  EXPECT_EQ(error.code(), ErrorCode::kSuccess);
  EXPECT_TRUE(error.message().empty());
}

// ========== Usage in the transfer path ==========

namespace {

constexpr uint64_t kHeaderBytes = 40;

Expected<uint64_t, Error> ParseWindow(const std::string& text) {
  if (text.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Empty window size"));
  }
  uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Not a number", text));
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  if (value == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kOutOfRange, "Window must be positive"));
  }
  return value;
}

Expected<uint64_t, Error> CountWindows(uint64_t content_length, const std::string& window_text) {
  return ParseWindow(window_text).transform(
      [content_length](uint64_t window) { return (kHeaderBytes + content_length) / window + 1; });
}

}  // namespace

TEST(ExpectedTest, WindowCountChain) {
  auto count = CountWindows(160, "100");
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 3u);

  auto empty = CountWindows(160, "");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code(), ErrorCode::kInvalidArgument);

  auto garbage = CountWindows(160, "12k");
  ASSERT_FALSE(garbage.has_value());
  EXPECT_EQ(garbage.error().context(), "12k");

  auto zero = CountWindows(160, "0");
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error().code(), ErrorCode::kOutOfRange);
}

TEST(ExpectedTest, AndThenStopsAtFirstError) {
  int calls = 0;
  auto upload = [&calls](uint64_t window) -> Expected<uint64_t, Error> {
    ++calls;
    return window * 2;
  };

  auto ok = ParseWindow("64").and_then(upload);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(*ok, 128u);

  auto failed = ParseWindow("x").and_then(upload);
  EXPECT_FALSE(failed.has_value());
  EXPECT_EQ(calls, 1);
}

// ========== Test BadExpectedAccess exception ==========

TEST(ExpectedTest, BadExpectedAccessException) {
  Expected<int, Error> error(MakeUnexpected(MakeError(ErrorCode::kTimeout, "Timed out")));

  try {
    int value = error.value();
    FAIL() << "Expected BadExpectedAccess exception, got value: " << value;
  } catch (const BadExpectedAccess<Error>& e) {
    EXPECT_EQ(e.error().code(), ErrorCode::kTimeout);
    EXPECT_STREQ(e.what(), "Bad Expected access: contains error");
  }
}
