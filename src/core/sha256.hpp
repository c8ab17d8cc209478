#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace dirimg::core {

class Sha256 {
 public:
  static constexpr std::size_t kDigestSize = 32;
  static constexpr std::size_t kBlockSize = 64;

  Sha256();

  void Update(std::span<const std::byte> bytes);
  void Update(std::string_view text);
  [[nodiscard]] std::array<std::byte, kDigestSize> Finalize();
  void Reset();

 private:
  void Transform(const std::uint8_t* chunk);

  std::array<std::uint8_t, kBlockSize> buffer_{};
  std::array<std::uint32_t, 8> state_{};
  std::uint64_t bit_length_ = 0;
  std::size_t buffer_len_ = 0;
  bool finalized_ = false;
};

[[nodiscard]] std::array<std::byte, Sha256::kDigestSize> Sha256Digest(std::span<const std::byte> bytes);
[[nodiscard]] std::string ToLowerHex(std::span<const std::byte> bytes);

}  // namespace dirimg::core
