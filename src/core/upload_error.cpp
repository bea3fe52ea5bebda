#include "upgate/core/upload_error.hpp"

#include <algorithm>

namespace upgate::core {

std::string_view violationKindToString(ViolationKind kind) {
  switch (kind) {
    case ViolationKind::kMissingFilename: return "missing-filename";
    case ViolationKind::kExtension: return "extension";
    case ViolationKind::kFilename: return "filename";
    case ViolationKind::kMimeType: return "mime-type";
    case ViolationKind::kMimeMismatch: return "mime-mismatch";
    case ViolationKind::kDangerousSignature: return "dangerous-signature";
    case ViolationKind::kContentPattern: return "content-pattern";
    case ViolationKind::kEntropy: return "entropy";
    case ViolationKind::kSmallPayload: return "small-payload";
    case ViolationKind::kSizeCategory: return "size-category";
    case ViolationKind::kFileTooLarge: return "file-too-large";
    case ViolationKind::kReadError: return "read-error";
  }
  return "unknown";
}

void ValidationOutcome::reject(ViolationKind kind, std::string message) {
  violations_.push_back(Violation{kind, std::move(message)});
}

void ValidationOutcome::merge(const ValidationOutcome& other) {
  violations_.insert(violations_.end(), other.violations_.begin(), other.violations_.end());
}

bool ValidationOutcome::has(ViolationKind kind) const {
  return std::any_of(violations_.begin(), violations_.end(),
                     [kind](const Violation& v) { return v.kind == kind; });
}

std::vector<std::string> ValidationOutcome::reasons() const {
  std::vector<std::string> result;
  result.reserve(violations_.size());
  for (const auto& violation : violations_) {
    result.push_back(violation.message);
  }
  return result;
}

std::string_view rateWindowToString(RateWindow window) {
  switch (window) {
    case RateWindow::kMinute: return "minute";
    case RateWindow::kHour: return "hour";
    case RateWindow::kDay: return "day";
    case RateWindow::kBytesPerHour: return "bytes-per-hour";
    case RateWindow::kBytesPerDay: return "bytes-per-day";
  }
  return "unknown";
}

std::string_view uploadErrorKindToString(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::kValidation: return "validation";
    case UploadErrorKind::kRateLimit: return "rate-limit";
    case UploadErrorKind::kStorage: return "storage";
  }
  return "unknown";
}

UploadError UploadError::validation(ValidationOutcome outcome) {
  UploadError error(UploadErrorKind::kValidation, outcome.reasons());
  error.outcome_ = std::move(outcome);
  return error;
}

UploadError UploadError::rateLimit(RateWindow window, std::string reason) {
  UploadError error(UploadErrorKind::kRateLimit, {std::move(reason)});
  error.window_ = window;
  return error;
}

UploadError UploadError::storage(std::string reason) {
  return UploadError(UploadErrorKind::kStorage, {std::move(reason)});
}

std::string UploadError::message() const {
  std::string joined;
  for (size_t i = 0; i < reasons_.size(); ++i) {
    if (i > 0) joined += "; ";
    joined += reasons_[i];
  }
  return joined;
}

Error UploadError::toError() const {
  switch (kind_) {
    case UploadErrorKind::kValidation:
      return makeError(ErrorCode::kValidationError, message());
    case UploadErrorKind::kRateLimit:
      return makeError(ErrorCode::kRateLimited, message());
    case UploadErrorKind::kStorage:
      return makeError(ErrorCode::kStorageError, message());
  }
  return makeError(ErrorCode::kUnknownError, message());
}

}  // namespace upgate::core
