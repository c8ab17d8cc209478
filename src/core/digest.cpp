#include "dirimg/digest.hpp"

#include "sha256.hpp"

#include <algorithm>

namespace dirimg {

DigestBuilder::DigestBuilder() : hasher_(std::make_unique<core::Sha256>()) {}
DigestBuilder::DigestBuilder(DigestBuilder&&) noexcept = default;
DigestBuilder& DigestBuilder::operator=(DigestBuilder&&) noexcept = default;
DigestBuilder::~DigestBuilder() = default;

void DigestBuilder::Update(std::span<const std::byte> bytes) {
  hasher_->Update(bytes);
}

std::string DigestBuilder::Finish() {
  const auto raw = hasher_->Finalize();
  return std::string(kDigestAlgorithmPrefix) + core::ToLowerHex(raw);
}

std::string ComputeDigest(std::span<const std::byte> bytes) {
  DigestBuilder builder;
  builder.Update(bytes);
  return builder.Finish();
}

std::string ComputeDigest(std::string_view text) {
  return ComputeDigest(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

bool IsValidDigest(std::string_view digest) {
  if (digest.size() != kDigestAlgorithmPrefix.size() + core::Sha256::kDigestSize * 2 ||
      digest.substr(0, kDigestAlgorithmPrefix.size()) != kDigestAlgorithmPrefix) {
    return false;
  }
  const auto hex = digest.substr(kDigestAlgorithmPrefix.size());
  return std::all_of(hex.begin(), hex.end(), [](char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
  });
}

}  // namespace dirimg
