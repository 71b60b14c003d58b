#include "test.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

#include "bc/core/util/Errors.hpp"
#include "bc/core/util/LoadJson.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/pipeline/PipelineParams.hpp"
#include "bc/pipeline/PipelineParamsIO.hpp"
#include "bc/pipeline/SeriesFilter.hpp"
#include "bc/testing/LifFixture.hpp"

using nlohmann::json;

TEST(PipelineParams, DefaultsMatchDocumentedValues)
{
    const bc::PipelineParams p;
    EXPECT_FLOAT_EQ(p.maxima_tolerance, 50.0);
    EXPECT_FLOAT_EQ(p.top_hat_radius, 5.0);
    EXPECT_FLOAT_EQ(p.median_radius, 1.0);
    EXPECT_EQ(p.channel, 2);
    EXPECT_FALSE(p.choose_lng);
    EXPECT_EQ(p.series_pattern, std::string("LNG"));
    EXPECT_EQ(p.extension, std::string(".lif"));
    EXPECT_NO_THROW(bc::pipeline::validate(p));
}

TEST(PipelineParams, ParsesEveryKey)
{
    const json j = {{"maxima_tolerance", 30}, {"top_hat_radius", 0}, {"median_radius", 2.5},
                    {"choose_lng", true}, {"series_pattern", "^lng_"}, {"channel", 1},
                    {"extension", ".LIF"}, {"exclude_edge_maxima", true}, {"threads", 4},
                    {"log_level", "debug"}};
    const bc::PipelineParams p = bc::pipeline::parseFromJson(j);
    EXPECT_FLOAT_EQ(p.maxima_tolerance, 30.0);
    EXPECT_FLOAT_EQ(p.top_hat_radius, 0.0);
    EXPECT_FLOAT_EQ(p.median_radius, 2.5);
    EXPECT_TRUE(p.choose_lng);
    EXPECT_EQ(p.series_pattern, std::string("^lng_"));
    EXPECT_EQ(p.channel, 1);
    EXPECT_EQ(p.extension, std::string(".LIF"));
    EXPECT_TRUE(p.exclude_edge_maxima);
    EXPECT_EQ(p.threads, 4);
    EXPECT_EQ(p.log_level, std::string("debug"));

    const bc::SpotDetectorParams d = p.detectorParams();
    EXPECT_FLOAT_EQ(d.prominence, 30.0);
    EXPECT_TRUE(d.excludeEdgeMaxima);
}

TEST(PipelineParams, OverlayTouchesOnlyPresentKeys)
{
    bc::PipelineParams p;
    p.channel = 3;
    bc::pipeline::applyJsonOverlay(p, json{{"maxima_tolerance", 12}});
    EXPECT_FLOAT_EQ(p.maxima_tolerance, 12.0);
    EXPECT_EQ(p.channel, 3);
}

TEST(PipelineParams, ToJsonRoundTrips)
{
    bc::PipelineParams p;
    p.choose_lng = true;
    p.maxima_tolerance = 7.5;
    const bc::PipelineParams back = bc::pipeline::parseFromJson(bc::pipeline::toJson(p));
    EXPECT_TRUE(back.choose_lng);
    EXPECT_FLOAT_EQ(back.maxima_tolerance, 7.5);
}

TEST(PipelineParams, RejectsUnknownAndMistypedKeys)
{
    EXPECT_THROW(bc::pipeline::parseFromJson(json{{"maxima_tolerence", 5}}), std::runtime_error);
    EXPECT_THROW(bc::pipeline::parseFromJson(json{{"channel", "two"}}), std::runtime_error);
    EXPECT_THROW(bc::pipeline::parseFromJson(json{{"channel", 1.5}}), std::runtime_error);
    EXPECT_THROW(bc::pipeline::parseFromJson(json{{"choose_lng", "maybe"}}), std::runtime_error);
}

TEST(PipelineParams, ValidationNamesTheKey)
{
    bc::PipelineParams p;
    p.median_radius = -1;
    try {
        bc::pipeline::validate(p);
        EXPECT_TRUE(false);
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("median_radius"), std::string::npos);
    }

    bc::PipelineParams q;
    q.channel = 0;
    EXPECT_THROW(bc::pipeline::validate(q), std::runtime_error);

    bc::PipelineParams r;
    r.series_pattern = "(unclosed";
    EXPECT_THROW(bc::pipeline::validate(r), std::runtime_error);

    bc::PipelineParams s;
    s.log_level = "loud";
    EXPECT_THROW(bc::pipeline::validate(s), std::runtime_error);
}

TEST(PipelineParams, LoadsFromFile)
{
    bc::testing::TempDir dir;
    const auto path = dir / "config.json";
    std::ofstream(path) << R"({"maxima_tolerance": 25, "choose_lng": true})";
    const bc::PipelineParams p = bc::pipeline::loadPipelineParams(path);
    EXPECT_FLOAT_EQ(p.maxima_tolerance, 25.0);
    EXPECT_TRUE(p.choose_lng);

    EXPECT_THROW(bc::pipeline::loadPipelineParams(dir / "absent.json"), bc::IOError);

    std::ofstream(dir / "broken.json") << "{ not json";
    EXPECT_THROW(bc::pipeline::loadPipelineParams(dir / "broken.json"), std::runtime_error);
}

TEST(SeriesFilter, MatchesCaseInsensitively)
{
    const bc::SeriesFilter f(true, "LNG");
    EXPECT_TRUE(f.accepts("Position1_lng_02"));
    EXPECT_TRUE(f.accepts("LNG_01"));
    EXPECT_FALSE(f.accepts("Nucleus_01"));

    const bc::SeriesFilter off(false, "LNG");
    EXPECT_TRUE(off.accepts("Nucleus_01"));
}

TEST(Logging, LevelsParse)
{
    EXPECT_TRUE(ParseLogLevel("warn").has_value());
    EXPECT_TRUE(ParseLogLevel("debug") == SimpleLogger::Level::Debug);
    EXPECT_FALSE(ParseLogLevel("chatty").has_value());
    EXPECT_FALSE(SetLogLevel("chatty"));
    EXPECT_TRUE(SetLogLevel("info"));
}
