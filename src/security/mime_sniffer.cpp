#include "upgate/security/mime_sniffer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace upgate::security {

namespace {

using namespace std::string_view_literals;

// Leading bytes at a fixed offset, optionally followed by a second marker
// (RIFF and ISO media containers carry the real type further in).
struct MagicSignature {
  std::string_view mime_type;
  size_t offset;
  std::string_view bytes;
  size_t sub_offset = 0;
  std::string_view sub_bytes = {};
};

constexpr std::array kMagicSignatures = {
  // Images
  MagicSignature{"image/png", 0, "\x89PNG\r\n\x1a\n"sv},
  MagicSignature{"image/jpeg", 0, "\xFF\xD8\xFF"sv},
  MagicSignature{"image/gif", 0, "GIF87a"sv},
  MagicSignature{"image/gif", 0, "GIF89a"sv},
  MagicSignature{"image/webp", 0, "RIFF"sv, 8, "WEBP"sv},
  MagicSignature{"image/bmp", 0, "BM"sv, 6, "\0\0\0\0"sv},
  // Documents
  MagicSignature{"application/pdf", 0, "%PDF-"sv},
  MagicSignature{"text/rtf", 0, "{\\rtf"sv},
  MagicSignature{"application/x-ole-storage", 0, "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"sv},
  // Archives
  MagicSignature{"application/zip", 0, "PK\x03\x04"sv},
  MagicSignature{"application/zip", 0, "PK\x05\x06"sv},
  MagicSignature{"application/zip", 0, "PK\x07\x08"sv},
  MagicSignature{"application/x-rar-compressed", 0, "Rar!\x1A\x07"sv},
  MagicSignature{"application/x-7z-compressed", 0, "7z\xBC\xAF\x27\x1C"sv},
  MagicSignature{"application/gzip", 0, "\x1F\x8B"sv},
  MagicSignature{"application/x-tar", 257, "ustar"sv},
  // Audio
  MagicSignature{"audio/mpeg", 0, "ID3"sv},
  MagicSignature{"audio/mpeg", 0, "\xFF\xFB"sv},
  MagicSignature{"audio/mpeg", 0, "\xFF\xF3"sv},
  MagicSignature{"audio/wav", 0, "RIFF"sv, 8, "WAVE"sv},
  MagicSignature{"audio/flac", 0, "fLaC"sv},
  // Video
  MagicSignature{"video/quicktime", 4, "ftypqt"sv},
  MagicSignature{"video/mp4", 4, "ftyp"sv},
  MagicSignature{"video/avi", 0, "RIFF"sv, 8, "AVI "sv},
  MagicSignature{"video/x-ms-wmv", 0, "\x30\x26\xB2\x75\x8E\x66\xCF\x11"sv},
};

bool matchesAt(std::string_view content, size_t offset, std::string_view bytes) {
  return content.size() >= offset + bytes.size() &&
         content.substr(offset, bytes.size()) == bytes;
}

bool matches(std::string_view content, const MagicSignature& sig) {
  if (!matchesAt(content, sig.offset, sig.bytes)) {
    return false;
  }
  return sig.sub_bytes.empty() || matchesAt(content, sig.sub_offset, sig.sub_bytes);
}

// Printable ASCII, common whitespace, and bytes of multi-byte UTF-8 sequences
bool looksLikeText(std::string_view content) {
  return std::none_of(content.begin(), content.end(), [](char ch) {
    auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) return false;
    if (c == '\n' || c == '\r' || c == '\t' || c == '\f') return false;
    return c < 0x20 || c == 0x7F;
  });
}

std::string lowerPrefix(std::string_view content, size_t length) {
  size_t start = 0;
  while (start < content.size() && std::isspace(static_cast<unsigned char>(content[start]))) {
    ++start;
  }
  std::string prefix(content.substr(start, length));
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return prefix;
}

std::string classifyText(std::string_view content) {
  auto head = lowerPrefix(content, 512);
  if (head.starts_with("<?xml")) {
    return head.find("<svg") != std::string::npos ? "image/svg+xml" : "application/xml";
  }
  if (head.starts_with("<svg")) {
    return "image/svg+xml";
  }
  if (head.starts_with("<!doctype html") || head.starts_with("<html")) {
    return "text/html";
  }
  return "text/plain";
}

}  // namespace

std::string_view mimeDetectionToString(MimeDetection mode) {
  switch (mode) {
    case MimeDetection::kSignature: return "signature";
    case MimeDetection::kDeclared: return "declared";
  }
  return "unknown";
}

std::optional<std::string> SignatureMimeSniffer::sniff(std::string_view content) const {
  if (content.empty()) {
    return std::nullopt;
  }

  for (const auto& sig : kMagicSignatures) {
    if (matches(content, sig)) {
      return std::string(sig.mime_type);
    }
  }

  if (looksLikeText(content)) {
    return classifyText(content);
  }

  return "application/octet-stream";
}

std::unique_ptr<MimeSniffer> makeMimeSniffer(MimeDetection mode) {
  switch (mode) {
    case MimeDetection::kSignature:
      return std::make_unique<SignatureMimeSniffer>();
    case MimeDetection::kDeclared:
      return std::make_unique<DeclaredMimeSniffer>();
  }
  return std::make_unique<DeclaredMimeSniffer>();
}

}  // namespace upgate::security
