#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace dirimg {

class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Returns 0 at end of stream. Errors are thrown.
  virtual std::size_t Read(std::span<std::byte> out) = 0;
};

class Layer {
 public:
  virtual ~Layer() = default;

  virtual std::string Digest() const = 0;
  virtual std::uint64_t Size() const = 0;
  virtual std::unique_ptr<ByteStream> Uncompressed() const = 0;
};

class Image {
 public:
  virtual ~Image() = default;

  virtual std::string RawManifest() const = 0;
  virtual std::string RawConfigFile() const = 0;
  // Throws when the image has no layer with this digest.
  virtual std::shared_ptr<const Layer> LayerByDigest(const std::string& digest) const = 0;
};

}  // namespace dirimg
