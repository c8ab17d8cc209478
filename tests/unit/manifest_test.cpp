#include "dirimg/digest.hpp"
#include "dirimg/errors.hpp"
#include "dirimg/manifest.hpp"
#include "dirimg/segment.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Exception>
void RequireThrows(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const Exception& ex) {
    dirimg::tests::Log(std::string("expected rejection: ") + ex.what());
    return;
  }
  throw std::runtime_error(message);
}

std::string Digest(const std::string& text) {
  return dirimg::ComputeDigest(std::string_view(text));
}

dirimg::Manifest ManifestWithLayers(const std::vector<dirimg::SegmentDescriptor>& segments) {
  dirimg::Manifest manifest;
  manifest.config.media_type = std::string(dirimg::kConfigMediaType);
  manifest.config.size = 2;
  manifest.config.digest = Digest("{}");
  for (const auto& segment : segments) {
    manifest.layers.push_back(dirimg::SegmentLayerDescriptor(segment));
  }
  return manifest;
}

void RunScenarioSegmentDescriptorContracts() {
  dirimg::tests::Log("scenario: segment descriptor length and validation");
  const dirimg::SegmentDescriptor segment("disk.img", 100, 249, Digest("x"));
  Require(segment.Length() == 150, "inclusive stop must give length 150");
  const dirimg::SegmentDescriptor single("disk.img", 7, 7, Digest("y"));
  Require(single.Length() == 1, "start == stop must give length 1");
  RequireThrows<std::invalid_argument>([] { dirimg::SegmentDescriptor("disk.img", 10, 9, "sha256:0"); },
                                       "stop before start must be rejected");
  RequireThrows<std::invalid_argument>([] { dirimg::SegmentDescriptor("", 0, 9, "sha256:0"); },
                                       "empty filename must be rejected");
  RequireThrows<std::invalid_argument>(
      [] { dirimg::SegmentDescriptor("disk.img", 0, std::numeric_limits<std::uint64_t>::max(), "sha256:0"); },
      "stop at the top of the offset range must be rejected");
}

void RunScenarioFileRecipesGroupAndSize() {
  dirimg::tests::Log("scenario: file recipes group by filename and order by offset");
  const std::vector<dirimg::SegmentDescriptor> segments = {
      {"b.bin", 100, 199, Digest("b2")},
      {"a.bin", 0, 9, Digest("a1")},
      {"b.bin", 0, 99, Digest("b1")},
      {"b.bin", 300, 349, Digest("b3")},
  };
  const auto recipes = dirimg::BuildFileRecipes(segments);
  Require(recipes.size() == 2, "expected two recipes");
  Require(recipes[0].filename == "a.bin" && recipes[0].Size() == 10, "a.bin recipe mismatch");
  Require(recipes[1].filename == "b.bin", "second recipe must be b.bin");
  Require(recipes[1].segments.size() == 3, "b.bin must hold three segments");
  Require(recipes[1].segments[0].Start() == 0 && recipes[1].segments[2].Start() == 300,
          "segments must be ordered by start");
  Require(recipes[1].Size() == 350, "size must be max(stop)+1 including the gap");
}

void RunScenarioManifestRoundTrip() {
  dirimg::tests::Log("scenario: serialized manifest parses back to the same segments");
  const std::vector<dirimg::SegmentDescriptor> segments = {
      {"vm/disk.img", 0, 4095, Digest("chunk-0")},
      {"vm/disk.img", 4096, 5000, Digest("chunk-1")},
      {"vm/nvram", 0, 63, Digest("nvram")},
  };
  auto manifest = ManifestWithLayers(segments);
  manifest.annotations.emplace("org.opencontainers.image.ref.name", "demo");
  const auto raw = dirimg::SerializeManifest(manifest);
  const auto parsed = dirimg::ParseManifest(raw);
  Require(parsed.schema_version == 2, "schema version must survive");
  Require(parsed.media_type == dirimg::kManifestMediaType, "media type must survive");
  Require(parsed.annotations.at("org.opencontainers.image.ref.name") == "demo", "annotations must survive");
  Require(parsed.config.digest == manifest.config.digest, "config digest must survive");

  const auto restored = dirimg::SegmentDescriptorsFromManifest(parsed);
  Require(restored.size() == segments.size(), "segment count mismatch");
  for (std::size_t i = 0; i < segments.size(); ++i) {
    Require(restored[i].Filename() == segments[i].Filename(), "filename mismatch");
    Require(restored[i].Start() == segments[i].Start(), "start mismatch");
    Require(restored[i].Stop() == segments[i].Stop(), "stop mismatch");
    Require(restored[i].Digest() == segments[i].Digest(), "digest mismatch");
  }
}

void RunScenarioMalformedManifestsRejected() {
  dirimg::tests::Log("scenario: malformed manifests raise ManifestError");
  RequireThrows<dirimg::ManifestError>([] { (void)dirimg::ParseManifest("{not json"); }, "invalid json must fail");
  RequireThrows<dirimg::ManifestError>([] { (void)dirimg::ParseManifest("[]"); }, "array document must fail");
  RequireThrows<dirimg::ManifestError>([] { (void)dirimg::ParseManifest(R"({"schemaVersion":2})"); },
                                       "missing config must fail");

  const auto config_digest = Digest("{}");
  const auto schema_one = R"({"schemaVersion":1,"config":{"mediaType":"x","size":2,"digest":")" + config_digest +
                          R"("}})";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::ParseManifest(schema_one); },
                                       "schemaVersion 1 must fail");
  const auto bad_digest = R"({"schemaVersion":2,"config":{"mediaType":"x","size":2,"digest":"md5:abc"}})";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::ParseManifest(bad_digest); },
                                       "invalid digest must fail");
  const auto bad_size = R"({"schemaVersion":2,"config":{"mediaType":"x","size":"big","digest":")" + config_digest +
                        R"("}})";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::ParseManifest(bad_size); },
                                       "non-numeric size must fail");
}

void RunScenarioSegmentAnnotationsValidated() {
  dirimg::tests::Log("scenario: layer annotations must describe a valid segment");
  const dirimg::SegmentDescriptor segment("disk.img", 0, 99, Digest("seg"));

  auto missing = ManifestWithLayers({segment});
  missing.layers[0].annotations.erase(std::string(dirimg::kSegmentStopAnnotation));
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(missing); },
                                       "missing stop annotation must fail");

  auto size_mismatch = ManifestWithLayers({segment});
  size_mismatch.layers[0].size = 99;
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(size_mismatch); },
                                       "size disagreeing with range must fail");

  auto not_a_number = ManifestWithLayers({segment});
  not_a_number.layers[0].annotations[std::string(dirimg::kSegmentStartAnnotation)] = "12abc";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(not_a_number); },
                                       "non-numeric start must fail");

  auto escaping = ManifestWithLayers({segment});
  escaping.layers[0].annotations[std::string(dirimg::kFilenameAnnotation)] = "../outside.img";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(escaping); },
                                       "filename escaping the root must fail");

  auto absolute = ManifestWithLayers({segment});
  absolute.layers[0].annotations[std::string(dirimg::kFilenameAnnotation)] = "/etc/passwd";
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(absolute); },
                                       "absolute filename must fail");

  auto wrapping = ManifestWithLayers({segment});
  wrapping.layers[0].annotations[std::string(dirimg::kSegmentStopAnnotation)] = "18446744073709551615";
  wrapping.layers[0].size = 0;
  RequireThrows<dirimg::ManifestError>([&] { (void)dirimg::SegmentDescriptorsFromManifest(wrapping); },
                                       "stop whose length wraps to zero must fail");
}

}  // namespace

int main() {
  try {
    dirimg::tests::Log("manifest_test: start");
    RunScenarioSegmentDescriptorContracts();
    RunScenarioFileRecipesGroupAndSize();
    RunScenarioManifestRoundTrip();
    RunScenarioMalformedManifestsRejected();
    RunScenarioSegmentAnnotationsValidated();
    dirimg::tests::Log("manifest_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    dirimg::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
