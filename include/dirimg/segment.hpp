#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dirimg {

class SegmentDescriptor {
 public:
  SegmentDescriptor(std::string filename, std::uint64_t start, std::uint64_t stop, std::string digest);

  [[nodiscard]] const std::string& Filename() const { return filename_; }
  [[nodiscard]] std::uint64_t Start() const { return start_; }
  // Inclusive.
  [[nodiscard]] std::uint64_t Stop() const { return stop_; }
  [[nodiscard]] const std::string& Digest() const { return digest_; }
  [[nodiscard]] std::uint64_t Length() const { return stop_ - start_ + 1; }
  [[nodiscard]] std::string ToString() const;

 private:
  std::string filename_;
  std::uint64_t start_ = 0;
  std::uint64_t stop_ = 0;
  std::string digest_;
};

struct FileRecipe {
  std::string filename;
  std::vector<SegmentDescriptor> segments{};

  [[nodiscard]] std::uint64_t Size() const;
};

// Groups segments by filename. Recipes are ordered by filename and their segments by start offset.
[[nodiscard]] std::vector<FileRecipe> BuildFileRecipes(const std::vector<SegmentDescriptor>& segments);

}  // namespace dirimg
