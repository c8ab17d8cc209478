#include "dirimg/sketch.hpp"

#include "dirimg/errors.hpp"

#include "../core/bounded_queue.hpp"
#include "../core/error_group.hpp"
#include "../core/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace dirimg {
namespace {

// Parsing is cheaper than walking, so a short queue keeps the walker from running ahead.
constexpr std::size_t kScanQueueCapacity = 2;

std::optional<CloneCandidate> ParseCandidate(const std::filesystem::path& manifest_path, const LogFunction& log) {
  std::ifstream in(manifest_path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("sketch: failed to open manifest " + manifest_path.string());
  }
  const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("sketch: failed to read manifest " + manifest_path.string());
  }

  try {
    auto manifest = ParseManifest(raw);
    return CloneCandidate{
        .descriptors = std::move(manifest.layers),
        .dir_path = manifest_path.parent_path(),
    };
  } catch (const ManifestError& ex) {
    core::LogTo(log, "skipping unparsable manifest " + manifest_path.string() + ": " + ex.what());
    return std::nullopt;
  }
}

}  // namespace

std::vector<CloneCandidate> FindCloneCandidates(const std::filesystem::path& root, const LogFunction& log) {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    if (ec) {
      throw std::filesystem::filesystem_error("sketch: unable to access scan root", root, ec);
    }
    return {};
  }

  core::BoundedQueue<std::filesystem::path> manifest_paths(kScanQueueCapacity);
  core::ErrorGroup group;

  group.Go([&]() {
    core::QueueCloser<std::filesystem::path> closer(manifest_paths);
    std::error_code walk_ec;
    std::filesystem::recursive_directory_iterator it(root, walk_ec);
    if (walk_ec) {
      throw std::filesystem::filesystem_error("sketch: error accessing path", root, walk_ec);
    }
    for (const std::filesystem::recursive_directory_iterator end{}; it != end;) {
      const auto& entry = *it;
      std::error_code type_ec;
      if (entry.path().filename().string() == kLocalManifestFilename && entry.is_regular_file(type_ec)) {
        if (!manifest_paths.Push(entry.path(), group.token())) {
          return;
        }
      }
      it.increment(walk_ec);
      if (walk_ec) {
        throw std::filesystem::filesystem_error("sketch: error walking directory tree", root, walk_ec);
      }
    }
  });

  std::vector<CloneCandidate> candidates{};
  try {
    while (auto path = manifest_paths.Pop()) {
      auto candidate = ParseCandidate(*path, log);
      if (candidate.has_value()) {
        candidates.push_back(std::move(*candidate));
      }
    }
  } catch (...) {
    // Stops the walker; Wait rethrows this error.
    group.Fail(std::current_exception());
  }
  group.Wait();

  std::sort(candidates.begin(), candidates.end(), [](const CloneCandidate& lhs, const CloneCandidate& rhs) {
    return lhs.dir_path < rhs.dir_path;
  });
  return candidates;
}

}  // namespace dirimg
