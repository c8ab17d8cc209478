#pragma once

#include "dirimg/image.hpp"

#include <array>
#include <cstddef>
#include <memory>

namespace dirimg::zstd {

inline constexpr std::array<std::byte, 4> kMagicHeader = {
    std::byte{0x28}, std::byte{0xB5}, std::byte{0x2F}, std::byte{0xFD},
};

// Compressed output is handed out in chunks of at least kOutputChunkSize bytes
// (except for the tail) so a network consumer is not fed many tiny writes.
inline constexpr std::size_t kOutputChunkSize = 1U << 20U;

[[nodiscard]] std::unique_ptr<ByteStream> CompressStream(std::unique_ptr<ByteStream> input, int level = 1);
[[nodiscard]] std::unique_ptr<ByteStream> DecompressStream(std::unique_ptr<ByteStream> input);

}  // namespace dirimg::zstd
