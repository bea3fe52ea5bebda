#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "upgate/security/mime_sniffer.hpp"
#include "upgate/security/upload_policy.hpp"

namespace upgate::security {

struct ClassificationResult {
  std::optional<std::string> detected_mime;  // Empty when the sniffer could not tell
  std::string effective_mime;                // Type used for allow-list and size decisions
  bool dangerous = false;                    // Native executable header present
  std::string dangerous_description;
  bool mime_mismatch = false;                // Declared type contradicts the content
  bool mime_allowed = true;                  // Effective type is on the allow-list
};

/**
 * @brief Decides a file's true kind from its leading bytes
 *
 * The executable-header check always runs. MIME detection depends on the
 * sniffer chosen at construction; without content sniffing only the declared
 * type is checked against the allow-list.
 */
class SignatureClassifier {
 public:
  static constexpr size_t kPrefixSize = 1024;

  SignatureClassifier(const UploadPolicy& policy, std::unique_ptr<MimeSniffer> sniffer);

  // Only the first kPrefixSize bytes of content are inspected
  ClassificationResult classify(std::string_view content, std::string_view declared_mime) const;

  // Description of the matched executable format, if any
  static std::optional<std::string> matchDangerousSignature(std::string_view content);

  // True if a file declared as `declared` may legitimately sniff as `detected`
  static bool compatibleTypes(std::string_view declared, std::string_view detected);

  const MimeSniffer& sniffer() const { return *sniffer_; }

 private:
  const UploadPolicy& policy_;
  std::unique_ptr<MimeSniffer> sniffer_;
};

}  // namespace upgate::security
