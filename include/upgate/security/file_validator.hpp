#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

#include "upgate/common.hpp"
#include "upgate/core/upload_error.hpp"
#include "upgate/security/content_scanner.hpp"
#include "upgate/security/signature_classifier.hpp"
#include "upgate/security/upload_policy.hpp"

namespace upgate::security {

// Which stages run. Relaxed is for authenticated, trusted internal callers.
enum class ValidationProfile {
  kStrict,   // Name, signature, MIME, content scan, size
  kRelaxed   // Name, signature, size
};

std::string_view profileToString(ValidationProfile profile);
Result<ValidationProfile> parseProfile(std::string_view value);

/**
 * @brief Staged file validation pipeline
 *
 * Stages:
 *   A. filename and extension rules          (all profiles)
 *   B. native executable signature           (all profiles, fails closed)
 *   C. MIME allow-list and declared mismatch (strict)
 *   D. content pattern and entropy scan      (strict)
 *   E. size ceiling by MIME category         (all profiles)
 *
 * Every triggered stage contributes its reasons to the outcome.
 */
class FileValidator {
 public:
  FileValidator(const UploadPolicy& policy, std::unique_ptr<MimeSniffer> sniffer);
  FileValidator(const UploadPolicy& policy, std::unique_ptr<MimeSniffer> sniffer,
                ContentScanner scanner);

  // Full pipeline over a file on disk. original_name defaults to the path's filename.
  core::ValidationOutcome validate(const std::filesystem::path& path,
                                   std::string_view declared_mime,
                                   ValidationProfile profile,
                                   std::string_view original_name = {}) const;

  // Stage A
  core::ValidationOutcome validateName(std::string_view filename) const;

  // Stage B over the leading bytes of the content
  core::ValidationOutcome validatePrefix(std::string_view prefix) const;

  // Stage E
  core::ValidationOutcome validateSize(std::uintmax_t size, std::string_view mime_type) const;

  const SignatureClassifier& classifier() const { return classifier_; }
  const ContentScanner& scanner() const { return scanner_; }
  const UploadPolicy& policy() const { return policy_; }

 private:
  void checkMime(const ClassificationResult& classification, std::string_view declared_mime,
                 core::ValidationOutcome& outcome) const;

  const UploadPolicy& policy_;
  SignatureClassifier classifier_;
  ContentScanner scanner_;
};

}  // namespace upgate::security
