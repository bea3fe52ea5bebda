#include "upgate/security/file_validator.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "upgate/util/filesystem.hpp"
#include "upgate/util/format.hpp"

namespace upgate::security {

namespace {

constexpr std::array<std::string_view, 10> kForbiddenNameParts = {
  "..", "/", "\\", "<", ">", ":", "\"", "|", "?", "*"
};

}  // namespace

std::string_view profileToString(ValidationProfile profile) {
  switch (profile) {
    case ValidationProfile::kStrict: return "strict";
    case ValidationProfile::kRelaxed: return "relaxed";
  }
  return "unknown";
}

Result<ValidationProfile> parseProfile(std::string_view value) {
  if (value == "strict") return ValidationProfile::kStrict;
  if (value == "relaxed") return ValidationProfile::kRelaxed;
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unknown validation profile: " + std::string(value)));
}

FileValidator::FileValidator(const UploadPolicy& policy, std::unique_ptr<MimeSniffer> sniffer)
    : FileValidator(policy, std::move(sniffer), ContentScanner{}) {
}

FileValidator::FileValidator(const UploadPolicy& policy, std::unique_ptr<MimeSniffer> sniffer,
                             ContentScanner scanner)
    : policy_(policy),
      classifier_(policy, std::move(sniffer)),
      scanner_(std::move(scanner)) {
}

core::ValidationOutcome FileValidator::validate(const std::filesystem::path& path,
                                                std::string_view declared_mime,
                                                ValidationProfile profile,
                                                std::string_view original_name) const {
  core::ValidationOutcome outcome;

  std::string name = original_name.empty() ? path.filename().string() : std::string(original_name);
  outcome.merge(validateName(name));

  // Strict needs the whole file for the content scan, relaxed only the header
  // Both profiles fail closed on a read error here. Only ContentScanner::scanFile,
  // used outside this pipeline, treats an unreadable file as safe.
  bool strict = profile == ValidationProfile::kStrict;
  auto content = strict
      ? util::FileSystem::readFile(path)
      : util::FileSystem::readPrefix(path, SignatureClassifier::kPrefixSize);
  if (!content.has_value()) {
    outcome.reject(core::ViolationKind::kReadError,
                   "Error reading file: " + content.error().message());
    return outcome;
  }

  auto classification = classifier_.classify(*content, declared_mime);

  if (classification.dangerous) {
    outcome.reject(core::ViolationKind::kDangerousSignature,
                   "Executable file detected: " + classification.dangerous_description);
  }

  if (strict) {
    checkMime(classification, declared_mime, outcome);

    auto scan = scanner_.scan(*content);
    if (!scan.safe) {
      outcome.reject(scan.kind, scan.reason);
    }
  }

  auto size = util::FileSystem::fileSize(path);
  if (!size.has_value()) {
    outcome.reject(core::ViolationKind::kReadError,
                   "Error checking file size: " + size.error().message());
    return outcome;
  }

  std::string_view size_mime = declared_mime.empty()
      ? std::string_view(classification.effective_mime) : declared_mime;
  outcome.merge(validateSize(*size, size_mime));

  if (!outcome.accepted()) {
    spdlog::debug("Validation ({}) rejected {}: {} reason(s)", profileToString(profile),
                  name, outcome.violations().size());
  }

  return outcome;
}

core::ValidationOutcome FileValidator::validateName(std::string_view filename) const {
  core::ValidationOutcome outcome;

  if (filename.empty()) {
    outcome.reject(core::ViolationKind::kMissingFilename, "File must have a filename");
    return outcome;
  }

  auto extension = lowercaseExtension(filename);
  if (extension.empty()) {
    outcome.reject(core::ViolationKind::kExtension, "File has no extension");
  } else if (policy_.isExtensionBlocked(extension)) {
    outcome.reject(core::ViolationKind::kExtension,
                   "File type '" + extension + "' is blocked");
  } else if (!policy_.isExtensionAllowed(extension)) {
    outcome.reject(core::ViolationKind::kExtension,
                   "File type '" + extension + "' is not allowed");
  }

  bool forbidden = std::any_of(kForbiddenNameParts.begin(), kForbiddenNameParts.end(),
                               [filename](std::string_view part) {
                                 return filename.find(part) != std::string_view::npos;
                               });
  bool control = std::any_of(filename.begin(), filename.end(), [](char ch) {
    auto c = static_cast<unsigned char>(ch);
    return c < 0x20 || c == 0x7F;
  });
  if (forbidden || control) {
    outcome.reject(core::ViolationKind::kFilename, "Filename contains invalid characters");
  }

  return outcome;
}

core::ValidationOutcome FileValidator::validatePrefix(std::string_view prefix) const {
  core::ValidationOutcome outcome;
  if (auto description = SignatureClassifier::matchDangerousSignature(prefix)) {
    outcome.reject(core::ViolationKind::kDangerousSignature,
                   "Executable file detected: " + *description);
  }
  return outcome;
}

core::ValidationOutcome FileValidator::validateSize(std::uintmax_t size,
                                                    std::string_view mime_type) const {
  core::ValidationOutcome outcome;
  auto limit = policy_.sizeLimitFor(mime_type);
  if (size > limit) {
    outcome.reject(core::ViolationKind::kSizeCategory,
                   "File size (" + util::formatMegabytes(size) + ") exceeds maximum allowed size (" +
                   util::formatMegabytes(limit) + ") for " + std::string(sizeCategory(mime_type)) +
                   " files");
  }
  return outcome;
}

void FileValidator::checkMime(const ClassificationResult& classification,
                              std::string_view declared_mime,
                              core::ValidationOutcome& outcome) const {
  if (!classification.mime_allowed) {
    outcome.reject(core::ViolationKind::kMimeType,
                   "File type '" + classification.effective_mime + "' is not allowed");
  }
  if (classification.mime_mismatch) {
    outcome.reject(core::ViolationKind::kMimeMismatch,
                   "MIME type mismatch: declared '" + std::string(declared_mime) +
                   "' but actual '" + classification.detected_mime.value_or("") + "'");
  }
}

}  // namespace upgate::security
