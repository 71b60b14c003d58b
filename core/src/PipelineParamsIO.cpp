#include "bc/pipeline/PipelineParamsIO.hpp"
#include "bc/pipeline/PipelineParams.hpp"
#include "bc/core/util/LoadJson.hpp"
#include "bc/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <regex>
#include <stdexcept>

namespace bc::pipeline {

namespace {

int int_or(const nlohmann::json* m, const char* key, int def)
{
    const double v = json::number_or(m, key, def);
    if (v != std::floor(v))
        throw std::runtime_error(std::string("field '") + key + "' must be an integer");
    return static_cast<int>(v);
}

} // namespace

PipelineParams parseFromJson(const nlohmann::json& j)
{
    PipelineParams p;
    applyJsonOverlay(p, j);
    return p;
}

nlohmann::json toJson(const PipelineParams& p)
{
    nlohmann::json j;
    j["maxima_tolerance"] = p.maxima_tolerance;
    j["top_hat_radius"] = p.top_hat_radius;
    j["median_radius"] = p.median_radius;
    j["exclude_edge_maxima"] = p.exclude_edge_maxima;
    j["choose_lng"] = p.choose_lng;
    j["series_pattern"] = p.series_pattern;
    j["channel"] = p.channel;
    j["extension"] = p.extension;
    j["threads"] = p.threads;
    j["log_level"] = p.log_level;
    return j;
}

void applyJsonOverlay(PipelineParams& base, const nlohmann::json& overlay)
{
    json::reject_unknown_fields(overlay,
                                {"maxima_tolerance", "top_hat_radius", "median_radius",
                                 "exclude_edge_maxima", "choose_lng", "series_pattern", "channel",
                                 "extension", "threads", "log_level"},
                                "configuration");

    const nlohmann::json* o = &overlay;
    base.maxima_tolerance = json::number_or(o, "maxima_tolerance", base.maxima_tolerance);
    base.top_hat_radius = json::number_or(o, "top_hat_radius", base.top_hat_radius);
    base.median_radius = json::number_or(o, "median_radius", base.median_radius);
    base.exclude_edge_maxima = json::bool_or(o, "exclude_edge_maxima", base.exclude_edge_maxima);
    base.choose_lng = json::bool_or(o, "choose_lng", base.choose_lng);
    base.series_pattern = json::string_or(o, "series_pattern", base.series_pattern);
    base.channel = int_or(o, "channel", base.channel);
    base.extension = json::string_or(o, "extension", base.extension);
    base.threads = int_or(o, "threads", base.threads);
    base.log_level = json::string_or(o, "log_level", base.log_level);
}

void validate(const PipelineParams& p)
{
    if (!(p.maxima_tolerance >= 0.0) || !std::isfinite(p.maxima_tolerance))
        throw std::runtime_error("maxima_tolerance must be >= 0");
    if (!(p.top_hat_radius >= 0.0) || !std::isfinite(p.top_hat_radius))
        throw std::runtime_error("top_hat_radius must be >= 0");
    if (!(p.median_radius >= 0.0) || !std::isfinite(p.median_radius))
        throw std::runtime_error("median_radius must be >= 0");
    if (p.channel < 1)
        throw std::runtime_error("channel must be >= 1 (1-based)");
    if (p.threads < 0)
        throw std::runtime_error("threads must be >= 0");
    if (p.extension.empty())
        throw std::runtime_error("extension must not be empty");
    if (!ParseLogLevel(p.log_level))
        throw std::runtime_error("log_level '" + p.log_level + "' is not a known level");
    try {
        std::regex probe(p.series_pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw std::runtime_error("series_pattern '" + p.series_pattern + "' does not compile: " + e.what());
    }
}

PipelineParams loadPipelineParams(const std::filesystem::path& path)
{
    const nlohmann::json j = json::load_json_file(path);
    PipelineParams p = parseFromJson(j);
    validate(p);
    return p;
}

} // namespace bc::pipeline
