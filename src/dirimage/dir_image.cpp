#include "dirimg/dir_image.hpp"

#include "dirimg/errors.hpp"
#include "dirimg/manifest.hpp"
#include "dirimg/progress.hpp"
#include "dirimg/sketch.hpp"

#include "../core/bounded_queue.hpp"
#include "../core/error_group.hpp"
#include "../core/log.hpp"
#include "sparse_file.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace dirimg {
namespace {

struct Job {
  SegmentDescriptor descriptor;
  std::shared_ptr<const Layer> layer;
};

std::runtime_error DirImageError(const std::string& message) {
  return std::runtime_error("dir_image: " + message);
}

void ValidateOptions(const WriteOptions& options) {
  if (options.workers_count < 1) {
    throw std::invalid_argument("dir_image: workers_count must be at least 1");
  }
  if (options.network_failure_retry_count < 1) {
    throw std::invalid_argument("dir_image: network_failure_retry_count must be at least 1");
  }
}

void WriteToSegment(const std::filesystem::path& destination_dir,
                    const SegmentDescriptor& segment,
                    ByteStream& src,
                    sparsefile::OverwriteCounts& counts) {
  const auto path = destination_dir / segment.Filename();
  std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
  if (!file) {
    throw DirImageError("failed to open '" + path.string() + "' for writing");
  }

  const auto consumed = sparsefile::Overwrite(file, segment.Start(), segment.Length(), src, counts);
  file.close();
  if (file.fail()) {
    core::LogError("error while closing file " + segment.Filename());
  }
  if (counts.written + counts.skipped != segment.Length() || consumed != segment.Length()) {
    throw IntegrityError("invalid number of bytes written+skipped for " + segment.ToString() +
                         ": segment length: " + std::to_string(segment.Length()) +
                         ", written+skipped: " + std::to_string(counts.written + counts.skipped) +
                         ", source bytes: " + std::to_string(consumed));
  }
}

void WriteLayer(const std::filesystem::path& destination_dir,
                const SegmentDescriptor& segment,
                const Layer* layer,
                sparsefile::OverwriteCounts& counts) {
  if (layer == nullptr) {
    throw DirImageError("nil layer provided for " + segment.ToString());
  }
  auto stream = layer->Uncompressed();
  if (stream == nullptr) {
    throw DirImageError("failed to access uncompressed layer " + layer->Digest());
  }
  WriteToSegment(destination_dir, segment, *stream, counts);
}

// Every file is sized once up front so segments can be written at any offset,
// and ranges nobody writes stay holes on filesystems that support them.
void TruncateFiles(const std::filesystem::path& destination_dir, const std::vector<SegmentDescriptor>& segments) {
  std::map<std::string, std::uint64_t> file_sizes{};
  for (const auto& segment : segments) {
    auto& size = file_sizes[segment.Filename()];
    size = std::max(size, segment.Stop() + 1);
  }

  for (const auto& [filename, size] : file_sizes) {
    const auto path = destination_dir / filename;
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        throw std::system_error(ec, "dir_image: failed to create directory for '" + filename + "'");
      }
    }
    {
      std::ofstream touch(path, std::ios::binary | std::ios::app);
      if (!touch) {
        throw DirImageError("error opening file '" + filename + "'");
      }
    }
    std::filesystem::resize_file(path, size, ec);
    if (ec) {
      throw std::system_error(ec, "dir_image: error while truncating file '" + filename + "'");
    }
  }
}

void SendProgressUpdate(const std::shared_ptr<ProgressChannel>& progress, std::uint64_t current, std::uint64_t total) {
  if (progress != nullptr) {
    progress->TrySend(ProgressUpdate{.bytes_processed = current, .bytes_total = total});
  }
}

void DeleteManifest(const std::filesystem::path& destination_dir) {
  std::error_code ec;
  std::filesystem::remove(destination_dir / kLocalManifestFilename, ec);
  if (ec) {
    throw std::system_error(ec, "dir_image: failed to delete manifest");
  }
}

// Written under a temporary name and renamed so a reader never sees a partial blob.
void WriteBlob(const std::filesystem::path& path, const std::string& bytes) {
  auto staging = path;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw DirImageError("failed to create " + staging.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw DirImageError("failed to write " + staging.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    throw std::system_error(ec, "dir_image: failed to publish " + path.string());
  }
}

}  // namespace

DirImage::DirImage(std::shared_ptr<const Image> image) : image_(std::move(image)) {
  if (image_ == nullptr) {
    throw std::invalid_argument("dir_image: invalid image");
  }
  segment_descriptors_ = SegmentDescriptorsFromManifest(ParseManifest(image_->RawManifest()));
}

std::vector<FileRecipe> DirImage::FileRecipes() const {
  return BuildFileRecipes(segment_descriptors_);
}

std::uint64_t DirImage::Length() const {
  std::uint64_t total = 0;
  for (const auto& segment : segment_descriptors_) {
    total += segment.Length();
  }
  return total;
}

Statistics DirImage::Stats() const {
  return Statistics{
      .bytes_cloned_count = bytes_cloned_count_.load(),
      .matching_segments_count = matching_segments_count_.load(),
      .bytes_read_count = bytes_read_count_.load(),
      .bytes_written_count = bytes_written_count_.load(),
      .bytes_skipped_count = bytes_skipped_count_.load(),
  };
}

void DirImage::ResetStats() {
  bytes_cloned_count_.store(0);
  matching_segments_count_.store(0);
  bytes_read_count_.store(0);
  bytes_written_count_.store(0);
  bytes_skipped_count_.store(0);
}

void DirImage::AddStats(const Statistics& stats) {
  bytes_cloned_count_.fetch_add(stats.bytes_cloned_count, std::memory_order_relaxed);
  matching_segments_count_.fetch_add(stats.matching_segments_count, std::memory_order_relaxed);
  bytes_read_count_.fetch_add(stats.bytes_read_count, std::memory_order_relaxed);
  bytes_written_count_.fetch_add(stats.bytes_written_count, std::memory_order_relaxed);
  bytes_skipped_count_.fetch_add(stats.bytes_skipped_count, std::memory_order_relaxed);
}

void DirImage::Write(const std::filesystem::path& destination, const WriteOptions& options) {
  const CancellationToken never_cancelled;
  Write(never_cancelled, destination, options);
}

void DirImage::Write(const CancellationToken& context,
                     const std::filesystem::path& destination,
                     const WriteOptions& options) {
  ValidateOptions(options);
  context.ThrowIfCancelled();

  std::error_code ec;
  std::filesystem::create_directories(destination, ec);
  if (ec) {
    throw std::system_error(ec, "dir_image: unable to create directory '" + destination.string() + "'");
  }
  DeleteManifest(destination);

  const auto& log = options.log;
  if (options.clone_root.has_value()) {
    DefaultSketchConstructor sketch(*options.clone_root, log);
    AddStats(sketch.Construct(destination, FileRecipes()));
  }

  const auto bytes_total = Length();
  SendProgressUpdate(options.progress, 0, bytes_total);

  TruncateFiles(destination, segment_descriptors_);

  core::BoundedQueue<Job> jobs(static_cast<std::size_t>(options.workers_count));

  // Returns the job's failure once retries are spent.
  const auto process = [&](const Job& job) -> std::exception_ptr {
    const auto& segment = job.descriptor;
    const auto length = segment.Length();
    const auto bytes_read = bytes_read_count_.fetch_add(length, std::memory_order_relaxed) + length;
    SendProgressUpdate(options.progress, bytes_read, bytes_total);

    if (sparsefile::Matches(segment, destination)) {
      bytes_skipped_count_.fetch_add(length, std::memory_order_relaxed);
      core::LogTo(log, "existing segment matches: " + segment.ToString());
      return nullptr;
    }

    std::exception_ptr failure{};
    for (int attempt = 1; attempt <= options.network_failure_retry_count; ++attempt) {
      sparsefile::OverwriteCounts counts{};
      try {
        WriteLayer(destination, segment, job.layer.get(), counts);
        bytes_written_count_.fetch_add(counts.written, std::memory_order_relaxed);
        bytes_skipped_count_.fetch_add(counts.skipped, std::memory_order_relaxed);
        core::LogTo(log, "downloaded segment: " + segment.ToString() + ", written=" + std::to_string(counts.written) +
                             ", skipped=" + std::to_string(counts.skipped));
        failure = nullptr;
        break;
      } catch (const std::exception& ex) {
        // Counters track attempted I/O, failed attempts included.
        bytes_written_count_.fetch_add(counts.written, std::memory_order_relaxed);
        bytes_skipped_count_.fetch_add(counts.skipped, std::memory_order_relaxed);
        failure = std::current_exception();
        if (IsTransientNetworkError(ex) && attempt < options.network_failure_retry_count) {
          core::LogTo(log, "network failure on " + segment.ToString() + " (attempt " + std::to_string(attempt) +
                               " of " + std::to_string(options.network_failure_retry_count) + "): " + ex.what());
          continue;
        }
        core::LogTo(log, "failed writing to file '" + segment.Filename() + "' at offset '" +
                             std::to_string(segment.Start()) + "': " + ex.what());
        break;
      }
    }
    return failure;
  };

  core::ErrorGroup group(&context);
  // Destroyed before the group, so an unwind before the producer starts still wakes workers blocked in Pop.
  core::QueueCloser<Job> close_jobs(jobs);

  for (int w = 0; w < options.workers_count; ++w) {
    group.Go([&]() {
      while (auto job = jobs.Pop()) {
        if (auto failure = process(*job)) {
          group.Fail(failure);
        }
      }
    });
  }

  group.Go([&]() {
    core::QueueCloser<Job> closer(jobs);
    for (const auto& descriptor : segment_descriptors_) {
      auto layer = image_->LayerByDigest(descriptor.Digest());
      if (!jobs.Push(Job{descriptor, std::move(layer)}, group.token())) {
        throw CancelledError("dir_image: write cancelled");
      }
    }
  });

  group.Wait();
  if (context.IsCancelled()) {
    throw CancelledError("dir_image: write cancelled");
  }

  WriteConfigAndManifest(destination);
}

void DirImage::WriteConfigAndManifest(const std::filesystem::path& destination) const {
  const auto raw_manifest = image_->RawManifest();
  const auto raw_config = image_->RawConfigFile();
  WriteBlob(destination / kLocalConfigFilename, raw_config);
  WriteBlob(destination / kLocalManifestFilename, raw_manifest);
}

}  // namespace dirimg
