#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace dirimg {

namespace core {
class Sha256;
}  // namespace core

inline constexpr std::string_view kDigestAlgorithmPrefix = "sha256:";

// Incremental "sha256:<hex>" digest.
class DigestBuilder {
 public:
  DigestBuilder();
  DigestBuilder(const DigestBuilder&) = delete;
  DigestBuilder& operator=(const DigestBuilder&) = delete;
  DigestBuilder(DigestBuilder&&) noexcept;
  DigestBuilder& operator=(DigestBuilder&&) noexcept;
  ~DigestBuilder();

  void Update(std::span<const std::byte> bytes);
  [[nodiscard]] std::string Finish();

 private:
  std::unique_ptr<core::Sha256> hasher_;
};

[[nodiscard]] std::string ComputeDigest(std::span<const std::byte> bytes);
[[nodiscard]] std::string ComputeDigest(std::string_view text);
[[nodiscard]] bool IsValidDigest(std::string_view digest);

}  // namespace dirimg
