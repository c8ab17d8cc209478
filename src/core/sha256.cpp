#include "sha256.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace dirimg::core {
namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
    0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
    0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
    0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
    0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
    0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
    0xc67178f2,
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

constexpr std::uint32_t RotateRight(std::uint32_t value, std::uint32_t bits) {
  return (value >> bits) | (value << (32U - bits));
}

std::uint32_t LoadBE32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256() : state_(kInitialState) {}

void Sha256::Reset() {
  state_ = kInitialState;
  bit_length_ = 0;
  buffer_len_ = 0;
  finalized_ = false;
}

void Sha256::Update(std::span<const std::byte> bytes) {
  if (finalized_) {
    throw std::logic_error("Sha256::Update called after Finalize");
  }

  const auto* data = reinterpret_cast<const std::uint8_t*>(bytes.data());
  std::size_t remaining = bytes.size();

  if (buffer_len_ > 0) {
    const auto take = std::min(remaining, kBlockSize - buffer_len_);
    std::memcpy(buffer_.data() + buffer_len_, data, take);
    buffer_len_ += take;
    data += take;
    remaining -= take;
    if (buffer_len_ < kBlockSize) {
      return;
    }
    Transform(buffer_.data());
    bit_length_ += 512;
    buffer_len_ = 0;
  }

  // Whole blocks are hashed straight from the caller's buffer.
  while (remaining >= kBlockSize) {
    Transform(data);
    bit_length_ += 512;
    data += kBlockSize;
    remaining -= kBlockSize;
  }

  if (remaining > 0) {
    std::memcpy(buffer_.data(), data, remaining);
    buffer_len_ = remaining;
  }
}

void Sha256::Update(std::string_view text) {
  Update(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

std::array<std::byte, Sha256::kDigestSize> Sha256::Finalize() {
  if (!finalized_) {
    const std::uint64_t total_bits = bit_length_ + static_cast<std::uint64_t>(buffer_len_ * 8U);

    buffer_[buffer_len_++] = 0x80;
    if (buffer_len_ > 56) {
      std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_len_), buffer_.end(), std::uint8_t{0});
      Transform(buffer_.data());
      buffer_len_ = 0;
    }
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_len_), buffer_.begin() + 56, std::uint8_t{0});
    for (int i = 0; i < 8; ++i) {
      buffer_[56 + i] = static_cast<std::uint8_t>((total_bits >> ((7 - i) * 8)) & 0xFFU);
    }
    Transform(buffer_.data());
    buffer_len_ = 0;
    finalized_ = true;
  }

  std::array<std::byte, kDigestSize> out{};
  for (std::size_t i = 0; i < state_.size(); ++i) {
    out[i * 4 + 0] = static_cast<std::byte>((state_[i] >> 24) & 0xFFU);
    out[i * 4 + 1] = static_cast<std::byte>((state_[i] >> 16) & 0xFFU);
    out[i * 4 + 2] = static_cast<std::byte>((state_[i] >> 8) & 0xFFU);
    out[i * 4 + 3] = static_cast<std::byte>(state_[i] & 0xFFU);
  }
  return out;
}

void Sha256::Transform(const std::uint8_t* chunk) {
  std::array<std::uint32_t, 64> w{};
  for (std::size_t i = 0; i < 16; ++i) {
    w[i] = LoadBE32(chunk + i * 4);
  }
  for (std::size_t i = 16; i < 64; ++i) {
    const std::uint32_t s0 = RotateRight(w[i - 15], 7) ^ RotateRight(w[i - 15], 18) ^ (w[i - 15] >> 3);
    const std::uint32_t s1 = RotateRight(w[i - 2], 17) ^ RotateRight(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  std::array<std::uint32_t, 8> v = state_;
  for (std::size_t i = 0; i < 64; ++i) {
    const std::uint32_t s1 = RotateRight(v[4], 6) ^ RotateRight(v[4], 11) ^ RotateRight(v[4], 25);
    const std::uint32_t ch = (v[4] & v[5]) ^ ((~v[4]) & v[6]);
    const std::uint32_t temp1 = v[7] + s1 + ch + kRoundConstants[i] + w[i];
    const std::uint32_t s0 = RotateRight(v[0], 2) ^ RotateRight(v[0], 13) ^ RotateRight(v[0], 22);
    const std::uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t temp2 = s0 + maj;

    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + temp1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = temp1 + temp2;
  }

  for (std::size_t i = 0; i < state_.size(); ++i) {
    state_[i] += v[i];
  }
}

std::array<std::byte, Sha256::kDigestSize> Sha256Digest(std::span<const std::byte> bytes) {
  Sha256 hasher;
  hasher.Update(bytes);
  return hasher.Finalize();
}

std::string ToLowerHex(std::span<const std::byte> bytes) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const std::byte value : bytes) {
    const auto b = std::to_integer<std::uint8_t>(value);
    out.push_back(kHexDigits[b >> 4U]);
    out.push_back(kHexDigits[b & 0x0FU]);
  }
  return out;
}

}  // namespace dirimg::core
