#include <gtest/gtest.h>

#include "upgate/security/upload_policy.hpp"

using namespace upgate::security;

TEST(UploadPolicyTest, DefaultTables) {
  UploadPolicy policy;

  EXPECT_TRUE(policy.isExtensionAllowed(".pdf"));
  EXPECT_TRUE(policy.isExtensionAllowed(".PNG"));
  EXPECT_FALSE(policy.isExtensionAllowed(".exe"));
  EXPECT_TRUE(policy.isExtensionBlocked(".exe"));
  EXPECT_TRUE(policy.isExtensionBlocked(".Sh"));
  EXPECT_TRUE(policy.isMimeAllowed("image/png"));
  EXPECT_FALSE(policy.isMimeAllowed("application/x-msdownload"));
  EXPECT_EQ(policy.max_file_size, 10 * kMiB);
}

TEST(UploadPolicyTest, ExtensionInBothSetsIsBlocked) {
  UploadPolicy policy;
  // .js and .py appear on both lists
  EXPECT_TRUE(policy.isExtensionAllowed(".js"));
  EXPECT_TRUE(policy.isExtensionBlocked(".js"));
  EXPECT_TRUE(policy.isExtensionBlocked(".py"));
}

TEST(UploadPolicyTest, SizeCategories) {
  EXPECT_EQ(sizeCategory("image/png"), "image");
  EXPECT_EQ(sizeCategory("video/mp4"), "video");
  EXPECT_EQ(sizeCategory("audio/flac"), "audio");
  EXPECT_EQ(sizeCategory("application/zip"), "archive");
  EXPECT_EQ(sizeCategory("application/x-7z-compressed"), "archive");
  EXPECT_EQ(sizeCategory("application/pdf"), "document");
  EXPECT_EQ(sizeCategory(
      "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"), "document");
  EXPECT_EQ(sizeCategory("text/plain"), "default");
  EXPECT_EQ(sizeCategory(""), "default");
}

TEST(UploadPolicyTest, SizeLimitForCategory) {
  UploadPolicy policy;
  EXPECT_EQ(policy.sizeLimitFor("image/jpeg"), 5 * kMiB);
  EXPECT_EQ(policy.sizeLimitFor("video/quicktime"), 50 * kMiB);
  EXPECT_EQ(policy.sizeLimitFor("audio/mpeg"), 20 * kMiB);
  EXPECT_EQ(policy.sizeLimitFor("application/x-rar-compressed"), 25 * kMiB);
  EXPECT_EQ(policy.sizeLimitFor("application/pdf"), 10 * kMiB);
  EXPECT_EQ(policy.sizeLimitFor("application/json"), 10 * kMiB);
}

TEST(UploadPolicyTest, ExtensionHelpers) {
  EXPECT_EQ(lowercaseExtension("Report.PDF"), ".pdf");
  EXPECT_EQ(lowercaseExtension("archive.tar.gz"), ".gz");
  EXPECT_EQ(lowercaseExtension("README"), "");
  EXPECT_EQ(mimeTypeForExtension(".png"), "image/png");
  EXPECT_EQ(mimeTypeForExtension(".DOCX"),
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document");
  EXPECT_EQ(mimeTypeForExtension(".unknown"), "");
}
