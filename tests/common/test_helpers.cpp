#include "test_helpers.hpp"

#include <random>

namespace upgate::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "upgate_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(temp_dir_, ec);
}

ManualClock::ManualClock()
    : now_(std::make_shared<std::chrono::system_clock::time_point>(
          std::chrono::sys_days{std::chrono::year{2024} / 5 / 1} + std::chrono::hours(9))) {
}

std::function<std::chrono::system_clock::time_point()> ManualClock::source() const {
  auto now = now_;
  return [now] { return *now; };
}

std::string pngContent(size_t total_size) {
  std::string content("\x89PNG\r\n\x1a\n", 8);
  content.append("\x00\x00\x00\x0dIHDR", 8);
  if (content.size() < total_size) {
    content.append(total_size - content.size(), '\0');
  }
  return content;
}

std::string peExecutableContent() {
  std::string content("MZ\x90\x00\x03\x00\x00\x00", 8);
  content.append(120, '\0');
  return content;
}

std::string randomBytes(size_t count, std::uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  std::string bytes(count, '\0');
  for (auto& byte : bytes) {
    byte = static_cast<char>(dis(gen));
  }
  return bytes;
}

std::string allByteValues(size_t repeat) {
  std::string bytes;
  bytes.reserve(repeat * 256);
  for (size_t i = 0; i < repeat; ++i) {
    for (int value = 0; value < 256; ++value) {
      bytes.push_back(static_cast<char>(value));
    }
  }
  return bytes;
}

std::string plainText() {
  return "Quarterly planning notes: budget review for the design team.\n"
         "Action items are listed in the shared document for next week.\n";
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace upgate::test
