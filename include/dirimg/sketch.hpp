#pragma once

#include "dirimg/manifest.hpp"
#include "dirimg/segment.hpp"
#include "dirimg/types.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace dirimg {

struct CloneCandidate {
  std::vector<Descriptor> descriptors{};
  std::filesystem::path dir_path;
};

using SegmentDigestMap = std::unordered_map<std::string, const SegmentDescriptor*>;

// Every directory below root holding a parsable local manifest, sorted by dir_path.
// Unparsable manifests are skipped and reported to log; filesystem errors are thrown.
[[nodiscard]] std::vector<CloneCandidate> FindCloneCandidates(const std::filesystem::path& root,
                                                              const LogFunction& log = {});

[[nodiscard]] SegmentDigestMap BuildSegmentDigestMap(const FileRecipe& recipe);
[[nodiscard]] int ComputeScore(const SegmentDigestMap& segments, const CloneCandidate& candidate);

// Picks the best donor for each recipe and clones its file into dir. Recipes
// without a donor are left untouched.
Statistics Resolve(const std::filesystem::path& dir,
                   const std::vector<FileRecipe>& recipes,
                   const std::vector<CloneCandidate>& candidates,
                   const LogFunction& log = {});

class SketchConstructor {
 public:
  virtual ~SketchConstructor() = default;

  virtual Statistics Construct(const std::filesystem::path& dir, const std::vector<FileRecipe>& recipes) = 0;
};

class DefaultSketchConstructor final : public SketchConstructor {
 public:
  explicit DefaultSketchConstructor(std::filesystem::path root_directory, LogFunction log = {});

  Statistics Construct(const std::filesystem::path& dir, const std::vector<FileRecipe>& recipes) override;

 private:
  std::filesystem::path root_directory_;
  LogFunction log_;
};

}  // namespace dirimg
