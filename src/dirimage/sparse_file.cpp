#include "sparse_file.hpp"

#include "dirimg/digest.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace dirimg::sparsefile {
namespace {

constexpr std::size_t kBufferSize = 256U * 1024U;

std::runtime_error SparseFileError(const std::string& message) {
  return std::runtime_error("sparse_file: " + message);
}

// Reads up to out.size() bytes at offset; fewer come back past the end of the file.
std::size_t ReadAt(std::fstream& file, std::uint64_t offset, std::span<std::byte> out) {
  file.clear();
  file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!file) {
    throw SparseFileError("failed to seek for read");
  }
  file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  const auto got = static_cast<std::size_t>(file.gcount());
  if (file.bad()) {
    throw SparseFileError("failed to read existing bytes");
  }
  file.clear();
  return got;
}

void WriteAt(std::fstream& file, std::uint64_t offset, std::span<const std::byte> bytes) {
  file.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!file) {
    throw SparseFileError("failed to seek for write");
  }
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    throw SparseFileError("failed to write bytes");
  }
}

}  // namespace

std::uint64_t Overwrite(std::fstream& file,
                        std::uint64_t offset,
                        std::uint64_t length,
                        ByteStream& src,
                        OverwriteCounts& counts) {
  std::vector<std::byte> incoming(kBufferSize);
  std::vector<std::byte> existing(kBufferSize);
  std::uint64_t consumed = 0;

  while (consumed <= length) {
    const auto got = src.Read(incoming);
    if (got == 0) {
      break;
    }
    const auto position = consumed;
    consumed += got;
    if (position >= length) {
      break;
    }
    const auto usable = static_cast<std::size_t>(std::min<std::uint64_t>(got, length - position));
    const auto available = ReadAt(file, offset + position, std::span<std::byte>(existing.data(), usable));
    const auto same = [&](std::size_t i) { return i < available && incoming[i] == existing[i]; };

    std::size_t i = 0;
    while (i < usable) {
      std::size_t j = i;
      if (same(i)) {
        while (j < usable && same(j)) {
          ++j;
        }
        counts.skipped += j - i;
      } else {
        while (j < usable && !same(j)) {
          ++j;
        }
        WriteAt(file, offset + position + i, std::span<const std::byte>(incoming.data() + i, j - i));
        counts.written += j - i;
      }
      i = j;
    }
  }

  file.flush();
  if (!file) {
    throw SparseFileError("failed to flush written bytes");
  }
  return consumed;
}

bool Matches(const SegmentDescriptor& segment, const std::filesystem::path& destination_dir) {
  const auto path = destination_dir / segment.Filename();
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size < segment.Stop() + 1) {
    return false;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  in.seekg(static_cast<std::streamoff>(segment.Start()), std::ios::beg);
  if (!in) {
    return false;
  }

  std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(segment.Length(), kBufferSize)));
  DigestBuilder digest;
  std::uint64_t remaining = segment.Length();
  while (remaining > 0) {
    const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk));
    if (in.gcount() != static_cast<std::streamsize>(chunk)) {
      return false;
    }
    digest.Update(std::span<const std::byte>(buffer.data(), chunk));
    remaining -= chunk;
  }
  return digest.Finish() == segment.Digest();
}

}  // namespace dirimg::sparsefile
