#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>

namespace bc {
struct PipelineParams;
}

namespace bc::pipeline {

PipelineParams parseFromJson(const nlohmann::json& j);
nlohmann::json toJson(const PipelineParams& p);
// Overwrite only the fields whose keys appear in `overlay`.
void applyJsonOverlay(PipelineParams& base, const nlohmann::json& overlay);

// Throws std::runtime_error naming the first invalid key.
void validate(const PipelineParams& p);

// Defaults overlaid with the JSON file, validated.
PipelineParams loadPipelineParams(const std::filesystem::path& path);

} // namespace bc::pipeline
