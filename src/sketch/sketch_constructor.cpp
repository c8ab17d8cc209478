#include "dirimg/sketch.hpp"

#include "dirimg/duplicator.hpp"

#include "../core/log.hpp"

#include <system_error>
#include <utility>

namespace dirimg {
namespace {

bool SamePath(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
  std::error_code lhs_ec;
  std::error_code rhs_ec;
  const auto lhs_canonical = std::filesystem::weakly_canonical(lhs, lhs_ec);
  const auto rhs_canonical = std::filesystem::weakly_canonical(rhs, rhs_ec);
  if (!lhs_ec && !rhs_ec) {
    return lhs_canonical == rhs_canonical;
  }
  return lhs.lexically_normal() == rhs.lexically_normal();
}

}  // namespace

SegmentDigestMap BuildSegmentDigestMap(const FileRecipe& recipe) {
  SegmentDigestMap out{};
  out.reserve(recipe.segments.size());
  for (const auto& segment : recipe.segments) {
    out.emplace(segment.Digest(), &segment);
  }
  return out;
}

int ComputeScore(const SegmentDigestMap& segments, const CloneCandidate& candidate) {
  int score = 0;
  for (const auto& descriptor : candidate.descriptors) {
    if (segments.count(descriptor.digest) != 0) {
      ++score;
    }
  }
  return score;
}

Statistics Resolve(const std::filesystem::path& dir,
                   const std::vector<FileRecipe>& recipes,
                   const std::vector<CloneCandidate>& candidates,
                   const LogFunction& log) {
  Statistics stats{};
  for (const auto& recipe : recipes) {
    // A recipe can reference thousands of segments and a candidate thousands of
    // layers; the digest map keeps scoring linear in the candidate's layer count.
    const auto segments = BuildSegmentDigestMap(recipe);
    int best_score = 0;
    const CloneCandidate* best_candidate = nullptr;
    for (const auto& candidate : candidates) {
      const int score = ComputeScore(segments, candidate);
      if (score > best_score) {
        best_score = score;
        best_candidate = &candidate;
      }
    }
    if (best_candidate == nullptr) {
      continue;
    }

    stats.bytes_cloned_count += recipe.Size();
    stats.matching_segments_count += static_cast<std::uint64_t>(best_score);
    const auto src = best_candidate->dir_path / recipe.filename;
    const auto dest = dir / recipe.filename;
    if (SamePath(src, dest)) {
      continue;
    }

    std::error_code ec;
    if (dest.has_parent_path()) {
      std::filesystem::create_directories(dest.parent_path(), ec);
      if (ec) {
        throw std::system_error(ec, "sketch: unable to create directory for '" + dest.string() + "'");
      }
    }
    try {
      duplicator::CloneFile(src, dest);
    } catch (const std::system_error& ex) {
      throw std::system_error(ex.code(), "sketch: unable to clone source file '" + src.string() +
                                             "' to destination '" + dest.string() + "': " + ex.what());
    }
    std::filesystem::resize_file(dest, recipe.Size(), ec);
    if (ec) {
      throw std::system_error(ec, "sketch: error occurred while resizing file '" + dest.string() +
                                      "' to its new size '" + std::to_string(recipe.Size()) + "'");
    }
    core::LogTo(log, "cloned '" + src.string() + "' to '" + dest.string() + "' with " +
                         std::to_string(best_score) + " matching segments");
  }
  return stats;
}

DefaultSketchConstructor::DefaultSketchConstructor(std::filesystem::path root_directory, LogFunction log)
    : root_directory_(std::move(root_directory)), log_(std::move(log)) {}

Statistics DefaultSketchConstructor::Construct(const std::filesystem::path& dir, const std::vector<FileRecipe>& recipes) {
  const auto candidates = FindCloneCandidates(root_directory_, log_);
  core::LogTo(log_, "found " + std::to_string(candidates.size()) + " clone candidates under " +
                        root_directory_.string());

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::system_error(ec, "sketch: unable to create directory '" + dir.string() + "'");
  }
  return Resolve(dir, recipes, candidates, log_);
}

}  // namespace dirimg
