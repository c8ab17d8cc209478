#pragma once

#include "dirimg/image.hpp"
#include "dirimg/segment.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace dirimg::sparsefile {

struct OverwriteCounts {
  std::uint64_t written = 0;
  std::uint64_t skipped = 0;
};

// Copies src into file at offset, writing only the bytes that differ from what
// is already there. At most `length` bytes are applied; the return value is the
// number of bytes src produced, which exceeds `length` when src is too long.
// `counts` is updated as the copy progresses, so a failed copy still reports
// the I/O it performed.
std::uint64_t Overwrite(std::fstream& file,
                        std::uint64_t offset,
                        std::uint64_t length,
                        ByteStream& src,
                        OverwriteCounts& counts);

// True when destination_dir/segment.Filename() holds bytes hashing to the segment digest.
[[nodiscard]] bool Matches(const SegmentDescriptor& segment, const std::filesystem::path& destination_dir);

}  // namespace dirimg::sparsefile
