#pragma once

#include "hermit/common/result.hpp"
#include <filesystem>
#include <string>

namespace hermit::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// True when `candidate` equals `parent` or lies below it (lexical, no symlink resolution).
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Lexically normalized absolute form of `path`, without a trailing separator.
[[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes through a sibling `.tmp` file and renames it into place.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Appends one line (a newline is added) to `path`, creating the file if needed.
[[nodiscard]] Status append_line(const std::filesystem::path &path, const std::string &line);

} // namespace hermit::common
