#pragma once

#include <filesystem>

namespace dirimg::duplicator {

// Byte-identical copy of src at dst, replacing dst. Uses a copy-on-write clone
// where the filesystem supports one and a full data copy otherwise.
void CloneFile(const std::filesystem::path& src, const std::filesystem::path& dst);
void CloneDirectory(const std::filesystem::path& src_dir, const std::filesystem::path& dst_dir);

}  // namespace dirimg::duplicator
