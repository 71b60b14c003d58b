#include "bc/core/util/LoadJson.hpp"
#include "bc/core/util/Errors.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace bc::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw IOError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void save_json_file(const std::filesystem::path& path, const nlohmann::json& j)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw IOError("Cannot write JSON file: " + path.string());
    }
    file << j.dump(4) << "\n";
    if (!file) {
        throw IOError("Failed writing JSON file: " + path.string());
    }
}

void reject_unknown_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> known,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " must be a JSON object");
    }
    for (const auto& item : json.items()) {
        bool found = std::any_of(known.begin(), known.end(), [&](const char* k) {
            return item.key() == k;
        });
        if (!found) {
            throw std::runtime_error(context + " has unknown field: " + item.key());
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("field '") + key + "' is not a number");
        }
    }
    throw std::runtime_error(std::string("field '") + key + "' is not a number");
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number_integer()) return it->get<int64_t>() != 0;
    if (it->is_string()) {
        const auto s = it->get<std::string>();
        if (s == "true" || s == "1") return true;
        if (s == "false" || s == "0") return false;
    }
    throw std::runtime_error(std::string("field '") + key + "' must be a boolean");
}

} // namespace bc::json
