#pragma once

#include <string>

namespace partplan {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that don't exist from the working directory are also tried
// against the source tree and its parents, so bundled sample data resolves
// from a build directory.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Uses a temporary sibling file + rename so a crash mid-write never leaves a
// truncated report behind.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

// Local wall-clock time as "YYYYMMDD_HHMMSS".
std::string archive_timestamp();

// Copies `path` into `archive_dir` as "<stem>_<stamp><ext>" and returns the
// path of the copy. Throws std::runtime_error if the source is missing or the
// copy fails.
std::string archive_copy(const std::string& path, const std::string& archive_dir, const std::string& stamp);

} // namespace partplan
