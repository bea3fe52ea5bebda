#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "upgate/common.hpp"

namespace upgate::core {

// Rule that rejected a file
enum class ViolationKind {
  kMissingFilename,
  kExtension,
  kFilename,
  kMimeType,
  kMimeMismatch,
  kDangerousSignature,
  kContentPattern,
  kEntropy,
  kSmallPayload,
  kSizeCategory,
  kFileTooLarge,
  kReadError
};

std::string_view violationKindToString(ViolationKind kind);

struct Violation {
  ViolationKind kind;
  std::string message;
};

// Accepted iff no violation was recorded. Stages append, nothing short-circuits.
class ValidationOutcome {
 public:
  bool accepted() const { return violations_.empty(); }

  void reject(ViolationKind kind, std::string message);
  void merge(const ValidationOutcome& other);

  bool has(ViolationKind kind) const;
  const std::vector<Violation>& violations() const { return violations_; }
  std::vector<std::string> reasons() const;

 private:
  std::vector<Violation> violations_;
};

// Sliding window whose ceiling was hit
enum class RateWindow {
  kMinute,
  kHour,
  kDay,
  kBytesPerHour,
  kBytesPerDay
};

std::string_view rateWindowToString(RateWindow window);

enum class UploadErrorKind {
  kValidation,
  kRateLimit,
  kStorage
};

std::string_view uploadErrorKindToString(UploadErrorKind kind);

/**
 * @brief Typed rejection of an upload
 *
 * Carries the error kind and every reason, so the calling layer can map it to
 * its own transport (e.g. 400/429/500) and report all violated rules.
 */
class UploadError {
 public:
  static UploadError validation(ValidationOutcome outcome);
  static UploadError rateLimit(RateWindow window, std::string reason);
  static UploadError storage(std::string reason);

  UploadErrorKind kind() const { return kind_; }
  const std::vector<std::string>& reasons() const { return reasons_; }
  const std::vector<Violation>& violations() const { return outcome_.violations(); }
  std::optional<RateWindow> window() const { return window_; }

  // Reasons joined with "; "
  std::string message() const;

  // Collapse into the library-wide error type
  Error toError() const;

 private:
  UploadError(UploadErrorKind kind, std::vector<std::string> reasons)
      : kind_(kind), reasons_(std::move(reasons)) {}

  UploadErrorKind kind_;
  std::vector<std::string> reasons_;
  ValidationOutcome outcome_;
  std::optional<RateWindow> window_;
};

template <typename T>
using UploadResult = std::expected<T, UploadError>;

}  // namespace upgate::core
