#include "upgate/core/upload_token.hpp"

#include <random>

namespace upgate::core {

namespace {

// Crockford's Base32
constexpr char kBase32[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr size_t kBase32Size = 32;
constexpr size_t kTokenLength = 26;
constexpr size_t kTimestampLength = 10;
constexpr size_t kRandomnessLength = 16;

std::string encodeTimestamp(uint64_t milliseconds) {
  std::string result(kTimestampLength, '0');

  for (int i = kTimestampLength - 1; i >= 0; --i) {
    result[i] = kBase32[milliseconds % kBase32Size];
    milliseconds /= kBase32Size;
  }

  return result;
}

std::string generateRandomness() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(
      (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()));
  static thread_local std::uniform_int_distribution<> dis(0, kBase32Size - 1);

  std::string result;
  result.reserve(kRandomnessLength);

  for (size_t i = 0; i < kRandomnessLength; ++i) {
    result += kBase32[dis(gen)];
  }

  return result;
}

int decodeBase32Char(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'Z') {
    if (c == 'I' || c == 'L' || c == 'O' || c == 'U') return -1;
    if (c < 'I') return c - 'A' + 10;
    if (c < 'L') return c - 'A' + 9;
    if (c < 'O') return c - 'A' + 8;
    if (c < 'U') return c - 'A' + 7;
    return c - 'A' + 6;
  }
  return -1;
}

uint64_t decodeTimestamp(std::string_view timestamp) {
  uint64_t result = 0;

  for (char c : timestamp) {
    int value = decodeBase32Char(c);
    if (value < 0) return 0;
    result = result * kBase32Size + value;
  }

  return result;
}

}  // namespace

UploadToken UploadToken::generate() {
  return generate(std::chrono::system_clock::now());
}

UploadToken UploadToken::generate(std::chrono::system_clock::time_point timestamp) {
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      timestamp.time_since_epoch()).count();

  std::string token = encodeTimestamp(static_cast<uint64_t>(milliseconds));
  token += generateRandomness();

  return UploadToken(std::move(token));
}

Result<UploadToken> UploadToken::fromString(std::string_view str) {
  if (!isValidFormat(str)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid upload token: " + std::string(str)));
  }

  return UploadToken(std::string(str));
}

std::string UploadToken::toString() const {
  return value_;
}

std::chrono::system_clock::time_point UploadToken::timestamp() const {
  if (!isValid()) {
    return std::chrono::system_clock::time_point{};
  }

  uint64_t milliseconds = decodeTimestamp(std::string_view(value_).substr(0, kTimestampLength));
  return std::chrono::system_clock::time_point{
      std::chrono::milliseconds(milliseconds)
  };
}

bool UploadToken::operator==(const UploadToken& other) const noexcept {
  return value_ == other.value_;
}

bool UploadToken::operator!=(const UploadToken& other) const noexcept {
  return !(*this == other);
}

bool UploadToken::operator<(const UploadToken& other) const noexcept {
  return value_ < other.value_;
}

bool UploadToken::isValid() const noexcept {
  return !value_.empty() && isValidFormat(value_);
}

std::size_t UploadToken::Hash::operator()(const UploadToken& token) const noexcept {
  return std::hash<std::string>{}(token.value_);
}

UploadToken::UploadToken(std::string value) : value_(std::move(value)) {}

bool UploadToken::isValidFormat(std::string_view str) {
  if (str.length() != kTokenLength) {
    return false;
  }

  for (char c : str) {
    if (decodeBase32Char(c) < 0) {
      return false;
    }
  }

  return true;
}

}  // namespace upgate::core
