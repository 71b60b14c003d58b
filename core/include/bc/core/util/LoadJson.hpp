// LoadJson.hpp - JSON loading and validation utilities
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>

namespace bc::json {

/**
 * Parse a JSON document from disk.
 * @throws bc::IOError if the file is missing or unreadable
 * @throws std::runtime_error if the content is not valid JSON
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

// Write `j` pretty-printed to `path`, replacing any existing file.
void save_json_file(const std::filesystem::path& path, const nlohmann::json& j);

// ============ VALIDATION ============

/**
 * Reject keys that are not in `known`.
 * @param json The JSON object to validate
 * @param known List of accepted field names
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error naming the first unknown field
 */
void reject_unknown_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> known,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Returns a bool if present (bool, 0/1, "true"/"false"), else def.
bool bool_or(const nlohmann::json* m, const char* key, bool def);

} // namespace bc::json
