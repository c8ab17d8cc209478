#pragma once

#include "dirimg/image.hpp"
#include "dirimg/manifest.hpp"
#include "dirimg/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

namespace dirimg {

// An image whose layers are byte ranges of plain files in a local directory.
class LocalDirectoryImage final : public Image {
 public:
  // Splits every regular file below `dir` into chunk_size segments. Empty files are skipped.
  static std::shared_ptr<LocalDirectoryImage> FromFiles(const std::filesystem::path& dir,
                                                        const LocalImageOptions& options = {});
  // Serves a directory previously materialized by DirImage::Write.
  static std::shared_ptr<LocalDirectoryImage> FromManifest(const std::filesystem::path& dir);

  std::string RawManifest() const override;
  std::string RawConfigFile() const override;
  std::shared_ptr<const Layer> LayerByDigest(const std::string& digest) const override;

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }

 private:
  LocalDirectoryImage(std::filesystem::path root, std::string raw_manifest, std::string raw_config);

  std::filesystem::path root_;
  std::string raw_manifest_;
  std::string raw_config_;
  std::unordered_map<std::string, std::shared_ptr<const Layer>> layers_{};
};

}  // namespace dirimg
