#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace corvus::tasks
{

struct ArchiveOptions
{
    int compressionLevel = -1; // zlib level, -1 selects the library default
};

// Writes `inputs` into `destination` as "zip", "tar" or "tar.gz".
//
// Zip: a file input becomes one entry named after the file; a directory input
// contributes its contents relative to itself (no directory-name prefix).
// Tar: a file input keeps its path without the root; a directory input is
// stored under its own name together with all of its contents.
//
// On failure the partially written destination is removed and the reason is
// stored in errorMessage.
bool buildArchive(const std::vector<std::filesystem::path> &inputs,
                  const std::filesystem::path &destination,
                  std::string_view formatTag,
                  const ArchiveOptions &options = {},
                  std::string *errorMessage = nullptr);

} // namespace corvus::tasks
