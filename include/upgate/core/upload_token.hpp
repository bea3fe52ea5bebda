#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "upgate/common.hpp"

namespace upgate::core {

// ULID used as the stored-file token.
// 26 characters, Crockford base32: 48-bit millisecond time + 80 random bits
class UploadToken {
 public:
  // Create new token with current timestamp
  static UploadToken generate();

  // Create token with specific timestamp
  static UploadToken generate(std::chrono::system_clock::time_point timestamp);

  // Parse token from string
  static Result<UploadToken> fromString(std::string_view str);

  // Default constructor creates invalid token
  UploadToken() = default;

  std::string toString() const;

  // Timestamp component
  std::chrono::system_clock::time_point timestamp() const;

  bool operator==(const UploadToken& other) const noexcept;
  bool operator!=(const UploadToken& other) const noexcept;
  bool operator<(const UploadToken& other) const noexcept;

  bool isValid() const noexcept;

  struct Hash {
    std::size_t operator()(const UploadToken& token) const noexcept;
  };

 private:
  explicit UploadToken(std::string value);

  static bool isValidFormat(std::string_view str);

  std::string value_;
};

}  // namespace upgate::core

namespace std {
template <>
struct hash<upgate::core::UploadToken> : upgate::core::UploadToken::Hash {};
}  // namespace std
