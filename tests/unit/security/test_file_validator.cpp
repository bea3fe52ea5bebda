#include <gtest/gtest.h>

#include "upgate/security/file_validator.hpp"
#include "test_helpers.hpp"

using namespace upgate::security;
using namespace upgate::test;
using upgate::core::ViolationKind;

class FileValidatorTest : public ::testing::Test {
 protected:
  std::filesystem::path write(const std::string& name, const std::string& content) {
    return temp_.createFile(name, content);
  }

  TempDirectory temp_;
  UploadPolicy policy_;
  FileValidator validator_{policy_, std::make_unique<SignatureMimeSniffer>()};
};

TEST_F(FileValidatorTest, AcceptsPlainTextInStrictProfile) {
  auto path = write("notes.txt", plainText());

  auto outcome = validator_.validate(path, "text/plain", ValidationProfile::kStrict);
  EXPECT_TRUE(outcome.accepted()) << outcome.reasons().front();
}

TEST_F(FileValidatorTest, ExecutableRejectedInBothProfiles) {
  auto path = write("holiday.png", peExecutableContent());

  auto strict = validator_.validate(path, "image/png", ValidationProfile::kStrict);
  EXPECT_FALSE(strict.accepted());
  EXPECT_TRUE(strict.has(ViolationKind::kDangerousSignature));

  auto relaxed = validator_.validate(path, "image/png", ValidationProfile::kRelaxed);
  EXPECT_FALSE(relaxed.accepted());
  EXPECT_TRUE(relaxed.has(ViolationKind::kDangerousSignature));
  // Relaxed never reports MIME problems
  EXPECT_FALSE(relaxed.has(ViolationKind::kMimeMismatch));
}

TEST_F(FileValidatorTest, ImageSizeCategory) {
  auto small = write("small.png", pngContent(3 * kMiB));
  auto large = write("large.png", pngContent(6 * kMiB));

  EXPECT_TRUE(validator_.validate(small, "image/png", ValidationProfile::kRelaxed).accepted());
  EXPECT_TRUE(validator_.validate(small, "image/png", ValidationProfile::kStrict).accepted());

  auto outcome = validator_.validate(large, "image/png", ValidationProfile::kRelaxed);
  EXPECT_FALSE(outcome.accepted());
  EXPECT_TRUE(outcome.has(ViolationKind::kSizeCategory));
  EXPECT_NE(outcome.reasons().front().find("(5.0MB)"), std::string::npos);
}

TEST_F(FileValidatorTest, AggregatesEveryReason) {
  auto path = write("setup.exe", peExecutableContent());

  auto outcome = validator_.validate(path, "application/x-msdownload", ValidationProfile::kStrict);

  EXPECT_TRUE(outcome.has(ViolationKind::kExtension));
  EXPECT_TRUE(outcome.has(ViolationKind::kDangerousSignature));
  EXPECT_TRUE(outcome.has(ViolationKind::kMimeType));
  EXPECT_GE(outcome.violations().size(), 3u);
}

TEST_F(FileValidatorTest, MismatchOnlyInStrictProfile) {
  auto path = write("scan.png", "%PDF-1.4\n" + plainText());

  auto strict = validator_.validate(path, "image/png", ValidationProfile::kStrict);
  EXPECT_TRUE(strict.has(ViolationKind::kMimeMismatch));

  auto relaxed = validator_.validate(path, "image/png", ValidationProfile::kRelaxed);
  EXPECT_TRUE(relaxed.accepted());
}

TEST_F(FileValidatorTest, HighEntropyOnlyInStrictProfile) {
  auto path = write("bundle.zip", allByteValues(64));

  auto strict = validator_.validate(path, "application/zip", ValidationProfile::kStrict);
  EXPECT_TRUE(strict.has(ViolationKind::kEntropy));

  auto relaxed = validator_.validate(path, "application/zip", ValidationProfile::kRelaxed);
  EXPECT_TRUE(relaxed.accepted());
}

TEST_F(FileValidatorTest, ScriptContentRejectedInStrictProfile) {
  auto path = write("page.html", "<html><body onload=\"steal()\">Welcome to the page</body></html>");

  auto outcome = validator_.validate(path, "text/html", ValidationProfile::kStrict);
  EXPECT_TRUE(outcome.has(ViolationKind::kContentPattern));
}

TEST_F(FileValidatorTest, UnreadableFileFailsClosed) {
  auto outcome = validator_.validate(temp_.path() / "gone.pdf", "application/pdf",
                                     ValidationProfile::kRelaxed);

  EXPECT_FALSE(outcome.accepted());
  EXPECT_TRUE(outcome.has(ViolationKind::kReadError));
}

TEST_F(FileValidatorTest, OriginalNameOverridesStoredName) {
  auto path = write("01J8Y4N9W8K6W3K4T4S0S3QF4N.txt", plainText());

  auto outcome = validator_.validate(path, "text/plain", ValidationProfile::kRelaxed, "payload.sh");
  EXPECT_TRUE(outcome.has(ViolationKind::kExtension));
}

TEST_F(FileValidatorTest, ValidateName) {
  EXPECT_TRUE(validator_.validateName("report.pdf").accepted());
  EXPECT_TRUE(validator_.validateName("Photo.JPG").accepted());

  EXPECT_TRUE(validator_.validateName("").has(ViolationKind::kMissingFilename));
  EXPECT_TRUE(validator_.validateName("README").has(ViolationKind::kExtension));
  EXPECT_TRUE(validator_.validateName("tool.exe").has(ViolationKind::kExtension));
  EXPECT_TRUE(validator_.validateName("movie.mkv").has(ViolationKind::kExtension));
  EXPECT_TRUE(validator_.validateName("..\\secret.txt").has(ViolationKind::kFilename));
  EXPECT_TRUE(validator_.validateName("a|b.txt").has(ViolationKind::kFilename));
  EXPECT_TRUE(validator_.validateName(std::string("tab\tname.txt")).has(ViolationKind::kFilename));
}

TEST_F(FileValidatorTest, ValidatePrefix) {
  EXPECT_FALSE(validator_.validatePrefix(peExecutableContent()).accepted());
  EXPECT_FALSE(validator_.validatePrefix(std::string("\x7F" "ELF", 4)).accepted());
  EXPECT_TRUE(validator_.validatePrefix(pngContent(64)).accepted());
  EXPECT_TRUE(validator_.validatePrefix("").accepted());
}

TEST_F(FileValidatorTest, ValidateSize) {
  EXPECT_TRUE(validator_.validateSize(20 * kMiB, "video/mp4").accepted());
  EXPECT_TRUE(validator_.validateSize(20 * kMiB, "audio/wav").accepted());
  EXPECT_FALSE(validator_.validateSize(21 * kMiB, "audio/wav").accepted());
  EXPECT_FALSE(validator_.validateSize(26 * kMiB, "application/zip").accepted());
  EXPECT_FALSE(validator_.validateSize(11 * kMiB, "text/plain").accepted());
}

TEST(FileValidatorDeclaredTest, TrustsDeclaredTypeWithoutSniffing) {
  TempDirectory temp;
  UploadPolicy policy;
  FileValidator validator(policy, makeMimeSniffer(MimeDetection::kDeclared));

  auto path = temp.createFile("scan.png", "%PDF-1.4\n" + plainText());
  EXPECT_TRUE(validator.validate(path, "image/png", ValidationProfile::kStrict).accepted());

  auto exe = temp.createFile("scan2.png", peExecutableContent());
  EXPECT_FALSE(validator.validate(exe, "image/png", ValidationProfile::kStrict).accepted());
}

TEST(ValidationProfileTest, ParseAndFormat) {
  EXPECT_EQ(parseProfile("strict").value(), ValidationProfile::kStrict);
  EXPECT_EQ(parseProfile("relaxed").value(), ValidationProfile::kRelaxed);
  EXPECT_FALSE(parseProfile("lenient").has_value());
  EXPECT_EQ(profileToString(ValidationProfile::kRelaxed), "relaxed");
}
