#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace upgate::security {

// How the classifier learns a file's real type
enum class MimeDetection {
  kSignature,  // Magic bytes of the content
  kDeclared    // Trust the declared type only (reduced assurance)
};

std::string_view mimeDetectionToString(MimeDetection mode);

/**
 * @brief Content-sniffing capability
 *
 * Chosen once when the classifier is built. Implementations that cannot look
 * at content report detectsContent() == false and never return a type.
 */
class MimeSniffer {
 public:
  virtual ~MimeSniffer() = default;

  // Detected MIME type of the content prefix, nullopt if undetermined
  virtual std::optional<std::string> sniff(std::string_view content) const = 0;

  virtual bool detectsContent() const = 0;

  virtual std::string name() const = 0;
};

// Magic-byte table lookup with a printable-text fallback
class SignatureMimeSniffer : public MimeSniffer {
 public:
  std::optional<std::string> sniff(std::string_view content) const override;
  bool detectsContent() const override { return true; }
  std::string name() const override { return "signature"; }
};

// No content inspection at all
class DeclaredMimeSniffer : public MimeSniffer {
 public:
  std::optional<std::string> sniff(std::string_view /*content*/) const override {
    return std::nullopt;
  }
  bool detectsContent() const override { return false; }
  std::string name() const override { return "declared"; }
};

std::unique_ptr<MimeSniffer> makeMimeSniffer(MimeDetection mode);

}  // namespace upgate::security
