#include "dirimg/manifest.hpp"

#include "dirimg/digest.hpp"
#include "dirimg/errors.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <filesystem>
#include <limits>
#include <string>

namespace dirimg {
namespace {

using nlohmann::json;
using nlohmann::ordered_json;

ManifestError Malformed(const std::string& message) {
  return ManifestError("manifest: " + message);
}

Descriptor ParseDescriptor(const json& node, const std::string& where) {
  if (!node.is_object()) {
    throw Malformed(where + " must be an object");
  }
  Descriptor out;
  out.media_type = node.at("mediaType").get<std::string>();
  out.size = node.at("size").get<std::uint64_t>();
  out.digest = node.at("digest").get<std::string>();
  if (!IsValidDigest(out.digest)) {
    throw Malformed(where + " has invalid digest '" + out.digest + "'");
  }
  if (node.contains("annotations")) {
    out.annotations = node.at("annotations").get<Annotations>();
  }
  return out;
}

ordered_json DescriptorToJson(const Descriptor& descriptor) {
  ordered_json out;
  out["mediaType"] = descriptor.media_type;
  out["size"] = descriptor.size;
  out["digest"] = descriptor.digest;
  if (!descriptor.annotations.empty()) {
    out["annotations"] = descriptor.annotations;
  }
  return out;
}

const std::string& RequireAnnotation(const Descriptor& layer, std::string_view key) {
  const auto it = layer.annotations.find(std::string(key));
  if (it == layer.annotations.end()) {
    throw Malformed("layer " + layer.digest + " is missing annotation '" + std::string(key) + "'");
  }
  return it->second;
}

std::uint64_t ParseOffset(const Descriptor& layer, std::string_view key) {
  const auto& text = RequireAnnotation(layer, key);
  std::uint64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    throw Malformed("layer " + layer.digest + " has invalid " + std::string(key) + " '" + text + "'");
  }
  return value;
}

// Filenames come from untrusted manifests and must stay inside the destination.
void ValidateFilename(const Descriptor& layer, const std::string& filename) {
  const std::filesystem::path path(filename);
  if (filename.empty() || path.is_absolute() || path.has_root_name()) {
    throw Malformed("layer " + layer.digest + " has invalid filename '" + filename + "'");
  }
  for (const auto& part : path) {
    if (part == "..") {
      throw Malformed("layer " + layer.digest + " filename escapes the image root: '" + filename + "'");
    }
  }
}

}  // namespace

Manifest ParseManifest(std::string_view raw) {
  json doc;
  try {
    doc = json::parse(raw.begin(), raw.end());
  } catch (const json::parse_error& ex) {
    throw Malformed(std::string("invalid json: ") + ex.what());
  }
  if (!doc.is_object()) {
    throw Malformed("document must be an object");
  }

  try {
    Manifest out;
    out.schema_version = doc.at("schemaVersion").get<int>();
    if (out.schema_version != 2) {
      throw Malformed("unsupported schemaVersion " + std::to_string(out.schema_version));
    }
    out.media_type = doc.value("mediaType", std::string{});
    out.config = ParseDescriptor(doc.at("config"), "config");
    if (doc.contains("layers")) {
      const auto& layers = doc.at("layers");
      if (!layers.is_array()) {
        throw Malformed("layers must be an array");
      }
      out.layers.reserve(layers.size());
      for (std::size_t i = 0; i < layers.size(); ++i) {
        out.layers.push_back(ParseDescriptor(layers[i], "layer " + std::to_string(i)));
      }
    }
    if (doc.contains("annotations")) {
      out.annotations = doc.at("annotations").get<Annotations>();
    }
    return out;
  } catch (const json::exception& ex) {
    throw Malformed(ex.what());
  }
}

std::string SerializeManifest(const Manifest& manifest) {
  ordered_json doc;
  doc["schemaVersion"] = manifest.schema_version;
  doc["mediaType"] = manifest.media_type;
  doc["config"] = DescriptorToJson(manifest.config);
  auto layers = ordered_json::array();
  for (const auto& layer : manifest.layers) {
    layers.push_back(DescriptorToJson(layer));
  }
  doc["layers"] = std::move(layers);
  if (!manifest.annotations.empty()) {
    doc["annotations"] = manifest.annotations;
  }
  return doc.dump();
}

Descriptor SegmentLayerDescriptor(const SegmentDescriptor& segment) {
  Descriptor out;
  out.media_type = std::string(kSegmentLayerMediaType);
  out.size = segment.Length();
  out.digest = segment.Digest();
  out.annotations.emplace(std::string(kFilenameAnnotation), segment.Filename());
  out.annotations.emplace(std::string(kSegmentStartAnnotation), std::to_string(segment.Start()));
  out.annotations.emplace(std::string(kSegmentStopAnnotation), std::to_string(segment.Stop()));
  return out;
}

std::vector<SegmentDescriptor> SegmentDescriptorsFromManifest(const Manifest& manifest) {
  std::vector<SegmentDescriptor> out{};
  out.reserve(manifest.layers.size());
  for (const auto& layer : manifest.layers) {
    const auto& filename = RequireAnnotation(layer, kFilenameAnnotation);
    ValidateFilename(layer, filename);
    const auto start = ParseOffset(layer, kSegmentStartAnnotation);
    const auto stop = ParseOffset(layer, kSegmentStopAnnotation);
    if (stop < start) {
      throw Malformed("layer " + layer.digest + " range stop precedes start");
    }
    if (stop == std::numeric_limits<std::uint64_t>::max()) {
      throw Malformed("layer " + layer.digest + " range stop is out of range");
    }
    if (layer.size != stop - start + 1) {
      throw Malformed("layer " + layer.digest + " size " + std::to_string(layer.size) +
                      " does not match its range length " + std::to_string(stop - start + 1));
    }
    out.emplace_back(filename, start, stop, layer.digest);
  }
  return out;
}

}  // namespace dirimg
