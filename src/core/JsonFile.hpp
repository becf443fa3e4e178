#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace axiom {

// Write JSON to path atomically: temp file + rename, so a concurrent reader
// never sees a truncated document. Parent directories are created.
// Throws StorageFailure if the file cannot be written.
void write_json_atomic(const std::filesystem::path& path, const nlohmann::json& data);

// Read and parse a JSON document. Throws StorageFailure if the file cannot be
// opened or does not parse.
nlohmann::json read_json_file(const std::filesystem::path& path);

} // namespace axiom
