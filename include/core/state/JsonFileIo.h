#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace tugofwar {
namespace core {

// nullopt when the file is missing or does not parse
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& file_path);

// Writes <path>.tmp then renames over the target.
bool writeJsonFileAtomic(const std::filesystem::path& file_path, const nlohmann::json& doc);

} // namespace core
} // namespace tugofwar
