#include "dirimg/segment.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace dirimg {

SegmentDescriptor::SegmentDescriptor(std::string filename, std::uint64_t start, std::uint64_t stop, std::string digest)
    : filename_(std::move(filename)), start_(start), stop_(stop), digest_(std::move(digest)) {
  if (filename_.empty()) {
    throw std::invalid_argument("segment filename must not be empty");
  }
  if (stop_ < start_) {
    throw std::invalid_argument("segment stop " + std::to_string(stop_) + " precedes start " +
                                std::to_string(start_) + " in '" + filename_ + "'");
  }
  // Length() and Stop() + 1 must stay representable.
  if (stop_ == std::numeric_limits<std::uint64_t>::max()) {
    throw std::invalid_argument("segment stop " + std::to_string(stop_) + " is out of range in '" + filename_ + "'");
  }
}

std::string SegmentDescriptor::ToString() const {
  return filename_ + "[" + std::to_string(start_) + "-" + std::to_string(stop_) + "]@" + digest_;
}

std::uint64_t FileRecipe::Size() const {
  std::uint64_t size = 0;
  for (const auto& segment : segments) {
    size = std::max(size, segment.Stop() + 1);
  }
  return size;
}

std::vector<FileRecipe> BuildFileRecipes(const std::vector<SegmentDescriptor>& segments) {
  std::map<std::string, FileRecipe> by_filename{};
  for (const auto& segment : segments) {
    auto& recipe = by_filename[segment.Filename()];
    recipe.filename = segment.Filename();
    recipe.segments.push_back(segment);
  }

  std::vector<FileRecipe> out{};
  out.reserve(by_filename.size());
  for (auto& [filename, recipe] : by_filename) {
    std::stable_sort(recipe.segments.begin(), recipe.segments.end(),
                     [](const SegmentDescriptor& lhs, const SegmentDescriptor& rhs) {
                       return lhs.Start() < rhs.Start();
                     });
    out.push_back(std::move(recipe));
  }
  return out;
}

}  // namespace dirimg
