#pragma once

#include "dirimg/segment.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dirimg {

inline constexpr std::string_view kManifestMediaType = "application/vnd.oci.image.manifest.v1+json";
inline constexpr std::string_view kConfigMediaType = "application/vnd.oci.image.config.v1+json";
inline constexpr std::string_view kSegmentLayerMediaType = "application/vnd.dirimg.segment.v1";

inline constexpr std::string_view kFilenameAnnotation = "org.opencontainers.image.title";
inline constexpr std::string_view kSegmentStartAnnotation = "io.dirimg.segment.start";
inline constexpr std::string_view kSegmentStopAnnotation = "io.dirimg.segment.stop";

using Annotations = std::map<std::string, std::string>;

struct Descriptor {
  std::string media_type;
  std::uint64_t size = 0;
  std::string digest;
  Annotations annotations{};
};

struct Manifest {
  int schema_version = 2;
  std::string media_type{kManifestMediaType};
  Descriptor config{};
  std::vector<Descriptor> layers{};
  Annotations annotations{};
};

// Throws ManifestError on malformed JSON, a wrong schema version or invalid digests.
[[nodiscard]] Manifest ParseManifest(std::string_view raw);
[[nodiscard]] std::string SerializeManifest(const Manifest& manifest);

[[nodiscard]] Descriptor SegmentLayerDescriptor(const SegmentDescriptor& segment);
// Throws ManifestError when a layer lacks the filename or range annotations.
[[nodiscard]] std::vector<SegmentDescriptor> SegmentDescriptorsFromManifest(const Manifest& manifest);

}  // namespace dirimg
