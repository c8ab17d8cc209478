#include "dirimg/local_image.hpp"

#include "dirimg/digest.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dirimg {
namespace {

constexpr std::size_t kReadBufferSize = 1U << 20U;

std::runtime_error ImageError(const std::string& message) {
  return std::runtime_error("local_image: " + message);
}

std::string ReadWholeFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ImageError("failed to open " + path.string());
  }
  std::string out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw ImageError("failed to read " + path.string());
  }
  return out;
}

class FileRangeStream final : public ByteStream {
 public:
  FileRangeStream(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length)
      : in_(path, std::ios::binary), path_(path), remaining_(length) {
    if (!in_) {
      throw ImageError("failed to open " + path.string());
    }
    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in_) {
      throw ImageError("failed to seek in " + path.string());
    }
  }

  std::size_t Read(std::span<std::byte> out) override {
    if (remaining_ == 0 || out.empty()) {
      return 0;
    }
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, out.size()));
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in_.gcount());
    if (got == 0) {
      throw ImageError("unexpected end of file in " + path_.string());
    }
    remaining_ -= got;
    return got;
  }

 private:
  std::ifstream in_;
  std::filesystem::path path_;
  std::uint64_t remaining_ = 0;
};

class FileRangeLayer final : public Layer {
 public:
  FileRangeLayer(std::filesystem::path path, std::uint64_t offset, std::uint64_t length, std::string digest)
      : path_(std::move(path)), offset_(offset), length_(length), digest_(std::move(digest)) {}

  std::string Digest() const override { return digest_; }
  std::uint64_t Size() const override { return length_; }
  std::unique_ptr<ByteStream> Uncompressed() const override {
    return std::make_unique<FileRangeStream>(path_, offset_, length_);
  }

 private:
  std::filesystem::path path_;
  std::uint64_t offset_ = 0;
  std::uint64_t length_ = 0;
  std::string digest_;
};

std::string DigestFileRange(const std::filesystem::path& path, std::uint64_t offset, std::uint64_t length) {
  FileRangeStream stream(path, offset, length);
  std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(length, kReadBufferSize)));
  DigestBuilder builder;
  while (true) {
    const auto got = stream.Read(buffer);
    if (got == 0) {
      break;
    }
    builder.Update(std::span<const std::byte>(buffer.data(), got));
  }
  return builder.Finish();
}

bool IsImageMetadataFile(const std::filesystem::path& path) {
  const auto name = path.filename().string();
  return name == kLocalManifestFilename || name == kLocalConfigFilename;
}

std::string BuildConfig(const std::vector<SegmentDescriptor>& segments) {
  nlohmann::ordered_json diff_ids = nlohmann::ordered_json::array();
  for (const auto& segment : segments) {
    diff_ids.push_back(segment.Digest());
  }
  nlohmann::ordered_json config;
  config["rootfs"] = {{"type", "layers"}, {"diff_ids", std::move(diff_ids)}};
  return config.dump();
}

}  // namespace

LocalDirectoryImage::LocalDirectoryImage(std::filesystem::path root, std::string raw_manifest, std::string raw_config)
    : root_(std::move(root)), raw_manifest_(std::move(raw_manifest)), raw_config_(std::move(raw_config)) {}

std::shared_ptr<LocalDirectoryImage> LocalDirectoryImage::FromFiles(const std::filesystem::path& dir,
                                                                    const LocalImageOptions& options) {
  if (options.chunk_size == 0) {
    throw std::invalid_argument("local_image: chunk_size must be positive");
  }

  std::vector<std::filesystem::path> files{};
  for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
    if (!entry.is_regular_file() || IsImageMetadataFile(entry.path())) {
      continue;
    }
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<SegmentDescriptor> segments{};
  std::vector<std::shared_ptr<const Layer>> layers{};
  for (const auto& path : files) {
    const auto size = std::filesystem::file_size(path);
    const auto filename = std::filesystem::relative(path, dir).generic_string();
    for (std::uint64_t offset = 0; offset < size; offset += options.chunk_size) {
      const auto length = std::min(options.chunk_size, size - offset);
      auto digest = DigestFileRange(path, offset, length);
      segments.emplace_back(filename, offset, offset + length - 1, digest);
      layers.push_back(std::make_shared<FileRangeLayer>(path, offset, length, std::move(digest)));
    }
  }

  auto raw_config = BuildConfig(segments);
  Manifest manifest;
  manifest.config.media_type = std::string(kConfigMediaType);
  manifest.config.size = raw_config.size();
  manifest.config.digest = ComputeDigest(raw_config);
  for (const auto& segment : segments) {
    manifest.layers.push_back(SegmentLayerDescriptor(segment));
  }

  std::shared_ptr<LocalDirectoryImage> image(
      new LocalDirectoryImage(dir, SerializeManifest(manifest), std::move(raw_config)));
  for (auto& layer : layers) {
    // Equal digests mean equal bytes; the first range serves them all.
    image->layers_.emplace(layer->Digest(), std::move(layer));
  }
  return image;
}

std::shared_ptr<LocalDirectoryImage> LocalDirectoryImage::FromManifest(const std::filesystem::path& dir) {
  auto raw_manifest = ReadWholeFile(dir / kLocalManifestFilename);
  auto raw_config = ReadWholeFile(dir / kLocalConfigFilename);
  const auto segments = SegmentDescriptorsFromManifest(ParseManifest(raw_manifest));

  std::shared_ptr<LocalDirectoryImage> image(
      new LocalDirectoryImage(dir, std::move(raw_manifest), std::move(raw_config)));
  for (const auto& segment : segments) {
    if (image->layers_.count(segment.Digest()) != 0) {
      continue;
    }
    image->layers_.emplace(segment.Digest(),
                           std::make_shared<FileRangeLayer>(dir / segment.Filename(), segment.Start(),
                                                            segment.Length(), segment.Digest()));
  }
  return image;
}

std::string LocalDirectoryImage::RawManifest() const {
  return raw_manifest_;
}

std::string LocalDirectoryImage::RawConfigFile() const {
  return raw_config_;
}

std::shared_ptr<const Layer> LocalDirectoryImage::LayerByDigest(const std::string& digest) const {
  const auto it = layers_.find(digest);
  if (it == layers_.end()) {
    throw ImageError("no layer with digest " + digest + " in " + root_.string());
  }
  return it->second;
}

}  // namespace dirimg
