#include <gtest/gtest.h>

#include "upgate/core/upload_error.hpp"

using namespace upgate::core;
using upgate::ErrorCode;

TEST(ValidationOutcomeTest, EmptyOutcomeIsAccepted) {
  ValidationOutcome outcome;
  EXPECT_TRUE(outcome.accepted());
  EXPECT_TRUE(outcome.reasons().empty());
}

TEST(ValidationOutcomeTest, MergeKeepsEveryReasonInOrder) {
  ValidationOutcome first;
  first.reject(ViolationKind::kExtension, "File type '.exe' is blocked");

  ValidationOutcome second;
  second.reject(ViolationKind::kDangerousSignature, "Executable file detected: PE executable");
  second.reject(ViolationKind::kSizeCategory, "too big");

  first.merge(second);

  ASSERT_EQ(first.violations().size(), 3u);
  EXPECT_FALSE(first.accepted());
  EXPECT_TRUE(first.has(ViolationKind::kDangerousSignature));
  EXPECT_FALSE(first.has(ViolationKind::kEntropy));
  EXPECT_EQ(first.reasons()[0], "File type '.exe' is blocked");
  EXPECT_EQ(first.reasons()[2], "too big");
}

TEST(UploadErrorTest, ValidationCarriesAllReasons) {
  ValidationOutcome outcome;
  outcome.reject(ViolationKind::kExtension, "first");
  outcome.reject(ViolationKind::kFilename, "second");

  auto error = UploadError::validation(outcome);

  EXPECT_EQ(error.kind(), UploadErrorKind::kValidation);
  EXPECT_EQ(error.reasons().size(), 2u);
  EXPECT_EQ(error.violations().size(), 2u);
  EXPECT_EQ(error.message(), "first; second");
  EXPECT_FALSE(error.window().has_value());
  EXPECT_EQ(error.toError().code(), ErrorCode::kValidationError);
}

TEST(UploadErrorTest, RateLimitNamesWindow) {
  auto error = UploadError::rateLimit(RateWindow::kBytesPerHour, "Upload volume limit exceeded");

  EXPECT_EQ(error.kind(), UploadErrorKind::kRateLimit);
  ASSERT_TRUE(error.window().has_value());
  EXPECT_EQ(*error.window(), RateWindow::kBytesPerHour);
  EXPECT_EQ(rateWindowToString(*error.window()), "bytes-per-hour");
  EXPECT_EQ(error.toError().code(), ErrorCode::kRateLimited);
}

TEST(UploadErrorTest, StorageMapsToStorageError) {
  auto error = UploadError::storage("disk full");
  EXPECT_EQ(error.kind(), UploadErrorKind::kStorage);
  EXPECT_EQ(error.toError().code(), ErrorCode::kStorageError);
  EXPECT_EQ(error.toError().message(), "disk full");
}
