#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace capguard {

// Reads and parses a JSON document. Returns nullopt when the file does not
// exist (cold start). Throws StoreUnavailableError if it exists but cannot
// be read or parsed.
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);

// Writes doc to "<path>.tmp" and renames it over path, so readers see either
// the old or the new document. Throws StoreUnavailableError on failure.
void writeJsonFileAtomic(const std::filesystem::path& path,
                         const nlohmann::json& doc);

}  // namespace capguard
