#pragma once

#include "dirimg/cancellation.hpp"
#include "dirimg/image.hpp"
#include "dirimg/segment.hpp"
#include "dirimg/types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace dirimg {

class DirImage {
 public:
  explicit DirImage(std::shared_ptr<const Image> image);
  DirImage(const DirImage&) = delete;
  DirImage& operator=(const DirImage&) = delete;

  // Materializes the image into destination. The local manifest is removed first
  // and only written back once every segment is in place, so a directory without
  // one is always an incomplete image.
  void Write(const CancellationToken& context, const std::filesystem::path& destination,
             const WriteOptions& options = {});
  void Write(const std::filesystem::path& destination, const WriteOptions& options = {});
  void WriteConfigAndManifest(const std::filesystem::path& destination) const;

  [[nodiscard]] const std::vector<SegmentDescriptor>& SegmentDescriptors() const { return segment_descriptors_; }
  [[nodiscard]] std::vector<FileRecipe> FileRecipes() const;
  // Sum of all segment lengths.
  [[nodiscard]] std::uint64_t Length() const;
  [[nodiscard]] Statistics Stats() const;
  void ResetStats();

 private:
  void AddStats(const Statistics& stats);

  std::shared_ptr<const Image> image_;
  std::vector<SegmentDescriptor> segment_descriptors_{};
  std::atomic<std::uint64_t> bytes_cloned_count_{0};
  std::atomic<std::uint64_t> matching_segments_count_{0};
  std::atomic<std::uint64_t> bytes_read_count_{0};
  std::atomic<std::uint64_t> bytes_written_count_{0};
  std::atomic<std::uint64_t> bytes_skipped_count_{0};
};

}  // namespace dirimg
