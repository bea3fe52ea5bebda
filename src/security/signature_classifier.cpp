#include "upgate/security/signature_classifier.hpp"

#include <array>
#include <utility>

namespace upgate::security {

namespace {

using namespace std::string_view_literals;

// PE, ELF and Mach-O headers
constexpr std::array<std::pair<std::string_view, std::string_view>, 4> kDangerousSignatures = {{
  {"\x4D\x5A"sv, "PE executable"},
  {"\x7F\x45\x4C\x46"sv, "ELF executable"},
  {"\xFE\xED\xFA"sv, "Mach-O executable"},
  {"\xCE\xFA\xED\xFE"sv, "Mach-O executable (64-bit)"},
}};

bool isZipDocument(std::string_view mime_type) {
  return mime_type.starts_with("application/vnd.openxmlformats-officedocument.") ||
         mime_type.starts_with("application/vnd.oasis.opendocument.");
}

bool isOleDocument(std::string_view mime_type) {
  return mime_type == "application/msword" ||
         mime_type == "application/vnd.ms-excel" ||
         mime_type == "application/vnd.ms-powerpoint";
}

bool isTextLike(std::string_view mime_type) {
  return mime_type.starts_with("text/") ||
         mime_type == "application/json" ||
         mime_type == "application/javascript" ||
         mime_type == "application/xml" ||
         mime_type == "image/svg+xml";
}

}  // namespace

SignatureClassifier::SignatureClassifier(const UploadPolicy& policy,
                                         std::unique_ptr<MimeSniffer> sniffer)
    : policy_(policy), sniffer_(std::move(sniffer)) {
  if (!sniffer_) {
    sniffer_ = std::make_unique<DeclaredMimeSniffer>();
  }
}

ClassificationResult SignatureClassifier::classify(std::string_view content,
                                                   std::string_view declared_mime) const {
  auto prefix = content.substr(0, kPrefixSize);

  ClassificationResult result;

  if (auto description = matchDangerousSignature(prefix)) {
    result.dangerous = true;
    result.dangerous_description = *description;
  }

  result.detected_mime = sniffer_->sniff(prefix);

  if (!result.detected_mime) {
    // Reduced assurance: nothing but the declared type to go on
    result.effective_mime = std::string(declared_mime);
    result.mime_allowed = declared_mime.empty() || policy_.isMimeAllowed(declared_mime);
    return result;
  }

  const auto& detected = *result.detected_mime;
  bool compatible = declared_mime.empty() || compatibleTypes(declared_mime, detected);

  result.mime_mismatch = !compatible;
  result.effective_mime = (!declared_mime.empty() && compatible)
      ? std::string(declared_mime) : detected;
  result.mime_allowed = policy_.isMimeAllowed(result.effective_mime);

  return result;
}

std::optional<std::string> SignatureClassifier::matchDangerousSignature(std::string_view content) {
  for (const auto& [signature, description] : kDangerousSignatures) {
    if (content.starts_with(signature)) {
      return std::string(description);
    }
  }
  return std::nullopt;
}

bool SignatureClassifier::compatibleTypes(std::string_view declared, std::string_view detected) {
  if (declared == detected) {
    return true;
  }
  // Office documents are containers
  if (detected == "application/zip" && isZipDocument(declared)) {
    return true;
  }
  if (detected == "application/x-ole-storage" && isOleDocument(declared)) {
    return true;
  }
  if (detected == "application/xml" && (declared == "image/svg+xml" || declared == "text/xml")) {
    return true;
  }
  if (detected == "text/plain" && isTextLike(declared)) {
    return true;
  }
  return false;
}

}  // namespace upgate::security
