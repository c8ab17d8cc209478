#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace dirimg {

inline constexpr std::string_view kLocalManifestFilename = ".oci.manifest.json";
inline constexpr std::string_view kLocalConfigFilename = ".oci.config.json";

struct Statistics {
  std::uint64_t bytes_cloned_count = 0;
  std::uint64_t matching_segments_count = 0;
  std::uint64_t bytes_read_count = 0;
  std::uint64_t bytes_written_count = 0;
  std::uint64_t bytes_skipped_count = 0;
};

struct ProgressUpdate {
  std::uint64_t bytes_processed = 0;
  std::uint64_t bytes_total = 0;
};

class ProgressChannel;

using LogFunction = std::function<void(std::string_view)>;

struct WriteOptions {
  int workers_count = 8;
  int network_failure_retry_count = 3;
  std::shared_ptr<ProgressChannel> progress{};
  // Empty means the library logger.
  LogFunction log{};
  // When set, local images below this root are scanned for clone donors before writing.
  std::optional<std::filesystem::path> clone_root{};
};

struct LocalImageOptions {
  std::uint64_t chunk_size = 64ULL * 1024ULL * 1024ULL;
};

}  // namespace dirimg
