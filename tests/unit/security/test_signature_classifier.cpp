#include <gtest/gtest.h>

#include "upgate/security/mime_sniffer.hpp"
#include "upgate/security/signature_classifier.hpp"
#include "test_helpers.hpp"

using namespace upgate::security;
using namespace upgate::test;

class SignatureClassifierTest : public ::testing::Test {
 protected:
  UploadPolicy policy_;
  SignatureClassifier classifier_{policy_, std::make_unique<SignatureMimeSniffer>()};
};

TEST_F(SignatureClassifierTest, DetectsNativeExecutables) {
  EXPECT_EQ(SignatureClassifier::matchDangerousSignature(peExecutableContent()), "PE executable");
  EXPECT_EQ(SignatureClassifier::matchDangerousSignature(std::string("\x7F" "ELF\x02\x01", 6)),
            "ELF executable");
  EXPECT_TRUE(SignatureClassifier::matchDangerousSignature(std::string("\xFE\xED\xFA\xCE", 4)));
  EXPECT_TRUE(SignatureClassifier::matchDangerousSignature(std::string("\xCE\xFA\xED\xFE", 4)));
  EXPECT_FALSE(SignatureClassifier::matchDangerousSignature(pngContent(64)));
  EXPECT_FALSE(SignatureClassifier::matchDangerousSignature(""));
}

TEST_F(SignatureClassifierTest, ExecutableDisguisedAsImage) {
  auto result = classifier_.classify(peExecutableContent(), "image/png");

  EXPECT_TRUE(result.dangerous);
  EXPECT_EQ(result.dangerous_description, "PE executable");
  EXPECT_TRUE(result.mime_mismatch);
}

TEST_F(SignatureClassifierTest, MatchingPng) {
  auto result = classifier_.classify(pngContent(256), "image/png");

  EXPECT_FALSE(result.dangerous);
  ASSERT_TRUE(result.detected_mime.has_value());
  EXPECT_EQ(*result.detected_mime, "image/png");
  EXPECT_FALSE(result.mime_mismatch);
  EXPECT_TRUE(result.mime_allowed);
  EXPECT_EQ(result.effective_mime, "image/png");
}

TEST_F(SignatureClassifierTest, DeclaredTypeContradictsContent) {
  auto result = classifier_.classify(pngContent(256), "application/pdf");

  EXPECT_TRUE(result.mime_mismatch);
  EXPECT_EQ(result.effective_mime, "image/png");
}

TEST_F(SignatureClassifierTest, DetectedTypeOutsideAllowList) {
  std::string gzip("\x1F\x8B\x08\x00", 4);
  gzip.append(60, 'a');
  policy_.allowed_mime_types.erase("application/gzip");

  auto result = classifier_.classify(gzip, "");

  ASSERT_TRUE(result.detected_mime.has_value());
  EXPECT_EQ(*result.detected_mime, "application/gzip");
  EXPECT_FALSE(result.mime_allowed);
}

TEST_F(SignatureClassifierTest, PlainTextAcceptsTextLikeDeclarations) {
  auto text = plainText();
  EXPECT_FALSE(classifier_.classify(text, "text/plain").mime_mismatch);
  EXPECT_FALSE(classifier_.classify(text, "text/csv").mime_mismatch);
  EXPECT_FALSE(classifier_.classify(text, "application/json").mime_mismatch);
  EXPECT_TRUE(classifier_.classify(text, "image/png").mime_mismatch);
}

TEST_F(SignatureClassifierTest, ContainerFormatsAreCompatible) {
  EXPECT_TRUE(SignatureClassifier::compatibleTypes(
      "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
      "application/zip"));
  EXPECT_TRUE(SignatureClassifier::compatibleTypes(
      "application/vnd.oasis.opendocument.text", "application/zip"));
  EXPECT_TRUE(SignatureClassifier::compatibleTypes("application/msword",
                                                   "application/x-ole-storage"));
  EXPECT_TRUE(SignatureClassifier::compatibleTypes("image/svg+xml", "application/xml"));
  EXPECT_FALSE(SignatureClassifier::compatibleTypes("application/pdf", "application/zip"));
}

TEST_F(SignatureClassifierTest, OnlyInspectsPrefix) {
  // Binary bytes past the first KiB do not change the detected type
  std::string content(SignatureClassifier::kPrefixSize, 'a');
  content.append(std::string("\x00\x01\x02\x03", 4));

  auto result = classifier_.classify(content, "text/plain");
  ASSERT_TRUE(result.detected_mime.has_value());
  EXPECT_EQ(*result.detected_mime, "text/plain");
  EXPECT_FALSE(result.mime_mismatch);
}

TEST(DeclaredSnifferClassifierTest, ChecksOnlyDeclaredType) {
  UploadPolicy policy;
  SignatureClassifier classifier(policy, makeMimeSniffer(MimeDetection::kDeclared));

  auto result = classifier.classify(pngContent(64), "application/pdf");
  EXPECT_FALSE(result.detected_mime.has_value());
  EXPECT_FALSE(result.mime_mismatch);
  EXPECT_TRUE(result.mime_allowed);
  EXPECT_EQ(result.effective_mime, "application/pdf");

  EXPECT_FALSE(classifier.classify(pngContent(64), "application/x-msdownload").mime_allowed);

  // The executable check never depends on the sniffer
  EXPECT_TRUE(classifier.classify(peExecutableContent(), "application/pdf").dangerous);
}

TEST(SignatureMimeSnifferTest, CommonFormats) {
  SignatureMimeSniffer sniffer;

  EXPECT_EQ(sniffer.sniff(std::string("\xFF\xD8\xFF\xE0", 4) + "JFIF"), "image/jpeg");
  EXPECT_EQ(sniffer.sniff("GIF89a" + std::string(10, '\0')), "image/gif");
  EXPECT_EQ(sniffer.sniff("%PDF-1.7\n"), "application/pdf");
  EXPECT_EQ(sniffer.sniff(std::string("PK\x03\x04", 4) + std::string(26, '\0')),
            "application/zip");
  EXPECT_EQ(sniffer.sniff("<?xml version=\"1.0\"?><svg xmlns=\"http://www.w3.org/2000/svg\"/>"),
            "image/svg+xml");
  EXPECT_EQ(sniffer.sniff("<!DOCTYPE html><html></html>"), "text/html");
  EXPECT_EQ(sniffer.sniff(plainText()), "text/plain");
  EXPECT_EQ(sniffer.sniff(std::string("\x01\x02\x03\x04", 4)), "application/octet-stream");
  EXPECT_FALSE(sniffer.sniff("").has_value());
}
