#pragma once

#include <string>

namespace parcelday {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against the source tree root (when built with PARCELDAY_SOURCE_DIR), so the
// bundled data/ files resolve from a build directory.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Writes to a temporary sibling file first and renames it into place.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

} // namespace parcelday
