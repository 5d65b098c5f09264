#pragma once

#include <filesystem>
#include <string>

namespace outpost::core {

// Reads the whole file into `out` (replaced on success).
[[nodiscard]] bool ReadFileToString(const std::filesystem::path& path,
                                    std::string& out,
                                    std::string* outError = nullptr) noexcept;

// Writes `bytes` to a sibling "<path>.tmp", then renames it over `path`. Missing parent
// directories are created. On failure the previous file (if any) is left untouched.
[[nodiscard]] bool WriteFileAtomic(const std::filesystem::path& path,
                                   const std::string& bytes,
                                   std::string* outError = nullptr) noexcept;

} // namespace outpost::core
