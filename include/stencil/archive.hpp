#pragma once

#include <stencil/result.hpp>
#include <filesystem>
#include <string>

namespace stencil {

// Bookkeeping file adapters write next to extracted content
inline constexpr const char* kSourceMarker = ".stencil-source";

// Extract an in-memory archive (tar, tar.gz, tar.bz2, tar.xz, zip) into
// `dest`, which must exist. Entries escaping `dest` are rejected.
Status extract_archive(const std::string& data, const std::filesystem::path& dest);

// A staging directory next to `final_dir`, created empty
Result<std::filesystem::path> make_staging_dir(const std::filesystem::path& final_dir);

// Replace `final_dir` with `staging` in one rename
Status commit_staging_dir(const std::filesystem::path& staging,
                          const std::filesystem::path& final_dir);

// The single top-level directory of an extracted tree, or `dir` itself when
// the tree has several top-level entries
std::filesystem::path archive_root(const std::filesystem::path& dir);

} // namespace stencil
