#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <algorithm>

namespace {

    const tc::RegionSpec *spec(const tc::RunConfig &config, const std::string &name) {
        auto it = std::find_if(config.catalogue.begin(), config.catalogue.end(),
                               [&](const tc::RegionSpec &s) { return s.name == name; });
        return it == config.catalogue.end() ? nullptr : &*it;
    }

    tc::CommandLine parse(std::vector<const char *> args) {
        args.insert(args.begin(), "trackcover");
        return tc::parseCommandLine(static_cast<int>(args.size()), args.data());
    }

} // namespace

TEST_CASE("Config - Defaults") {
    tc::RunConfig config;
    CHECK(config.sampleStride == 1);
    CHECK(config.jobs == 1);
    CHECK(config.regions.size() == 4);
    CHECK(config.catalogue.size() == 4);
    CHECK_FALSE(config.outputDir);
    CHECK_FALSE(config.diagnostics);
    CHECK_NOTHROW(tc::validate(config));
}

TEST_CASE("Config - JSON documents") {
    SUBCASE("Scalar settings") {
        auto config = tc::parseConfig(R"({
            "activities": "/data/tracks",
            "boundaries": "/data/countries.geojson",
            "name_attribute": "NAME_EN",
            "regions": ["UK", "World"],
            "sample_stride": 5,
            "jobs": 4,
            "circle_segments": 32,
            "output_dir": "/tmp/out",
            "log_level": "debug",
            "diagnostics": true
        })");
        CHECK(config.activities == "/data/tracks");
        CHECK(config.boundaries == "/data/countries.geojson");
        CHECK(config.nameAttribute == "NAME_EN");
        CHECK(config.regions == std::vector<std::string>{"UK", "World"});
        CHECK(config.sampleStride == 5);
        CHECK(config.jobs == 4);
        CHECK(config.circleSegments == 32);
        REQUIRE(config.outputDir);
        CHECK(*config.outputDir == "/tmp/out");
        CHECK(config.logLevel == "debug");
        CHECK(config.diagnostics);
    }

    SUBCASE("Custom regions and overrides") {
        auto config = tc::parseConfig(R"({
            "custom_regions": {
                "Peak District": {"bbox": [-2.1, 53.0, -1.5, 53.6], "buffer": 150},
                "Ireland": {"admin": "Ireland", "crs": "EPSG:2157"},
                "Sheffield": {"bbox": [-1.6, 53.3, -1.3, 53.5], "crs": "ENU"}
            },
            "region_overrides": {"UK": {"buffer": 250, "simplify": 20}}
        })");

        CHECK(config.catalogue.size() == 6);
        auto peak = spec(config, "Peak District");
        REQUIRE(peak);
        CHECK(peak->crs == tc::Crs::epsg(3857));
        CHECK(peak->bufferRadius == doctest::Approx(150.0));
        CHECK(std::get<tc::BoundingBox>(peak->kind).minLon == doctest::Approx(-2.1));

        auto ireland = spec(config, "Ireland");
        REQUIRE(ireland);
        CHECK(std::get<tc::AdministrativeBoundary>(ireland->kind).boundaryName == "Ireland");
        CHECK(ireland->crs == tc::Crs::epsg(2157));

        CHECK(spec(config, "Sheffield")->crs.kind == tc::CrsKind::LocalEnu);
        CHECK(spec(config, "UK")->bufferRadius == doctest::Approx(250.0));
        CHECK(spec(config, "UK")->simplifyTolerance == doctest::Approx(20.0));
        CHECK(spec(config, "UK")->crs == tc::Crs::epsg(27700));
    }

    SUBCASE("Unknown keys are ignored") {
        auto config = tc::parseConfig(R"({"colour": "blue", "jobs": 2})");
        CHECK(config.jobs == 2);
    }

    SUBCASE("Rejected documents") {
        CHECK_THROWS_AS(tc::parseConfig("{ nope"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig("[1, 2]"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"sample_stride": 0})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"sample_stride": 2.5})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"jobs": "many"})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"regions": "UK"})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"region_overrides": {"Mars": {"buffer": 1}}})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"custom_regions": {"X": {"admin": "France"}}})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"custom_regions": {"X": {"bbox": [1, 2, 3]}}})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"custom_regions": {"X": {"world": 0.1, "admin": "France"}}})"),
                        tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"region_overrides": {"UK": {"crs": "UTM"}}})"), tc::ConfigError);
        CHECK_THROWS_AS(tc::parseConfig(R"({"diagnostics": "yes"})"), tc::ConfigError);
    }
}

TEST_CASE("Config - Command line") {
    SUBCASE("Flags") {
        auto cl = parse({"--activities", "tracks", "--boundaries", "b.geojson", "--region", "Sheffield", "--region",
                         "UK", "--stride", "10", "--jobs", "3", "--output", "out", "--log-level", "warn"});
        CHECK_FALSE(cl.help);
        CHECK(cl.config.activities == "tracks");
        CHECK(cl.config.boundaries == "b.geojson");
        CHECK(cl.config.regions == std::vector<std::string>{"Sheffield", "UK"});
        CHECK(cl.config.sampleStride == 10);
        CHECK(cl.config.jobs == 3);
        REQUIRE(cl.config.outputDir);
        CHECK(*cl.config.outputDir == "out");
        CHECK(cl.config.logLevel == "warn");
        CHECK_FALSE(cl.config.diagnostics);

        CHECK(parse({"--diagnostics"}).config.diagnostics);
    }

    SUBCASE("Help") {
        CHECK(parse({"--help"}).help);
        CHECK(parse({"-h"}).help);
        CHECK(tc::usage("trackcover").find("--stride") != std::string::npos);
        CHECK(tc::usage("trackcover").find("--diagnostics") != std::string::npos);
    }

    SUBCASE("Usage errors") {
        CHECK_THROWS_AS(parse({"--stride", "0"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--stride", "-3"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--stride", "ten"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--jobs", "2x"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--region"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--frobnicate"}), tc::ConfigError);
        CHECK_THROWS_AS(parse({"--config", "/nonexistent/trackcover.json"}), tc::ConfigError);
    }

    SUBCASE("Flags override the configuration file") {
        fixtures::TempDir dir("trackcover_test_config");
        fixtures::writeFile(dir / "run.json",
                            R"({"sample_stride": 4, "jobs": 2, "regions": ["World"], "activities": "from_file"})");

        auto cl = parse({"--stride", "7", "--config", (dir / "run.json").c_str()});
        CHECK(cl.config.sampleStride == 7);
        CHECK(cl.config.jobs == 2);
        CHECK(cl.config.activities == "from_file");
        CHECK(cl.config.regions == std::vector<std::string>{"World"});
    }
}

TEST_CASE("Config - Validation") {
    tc::RunConfig config;

    SUBCASE("Regions required") {
        config.regions.clear();
        CHECK_THROWS_AS(tc::validate(config), tc::ConfigError);
    }

    SUBCASE("Log level") {
        config.logLevel = "chatty";
        CHECK_THROWS_AS(tc::validate(config), tc::ConfigError);
    }

    SUBCASE("Circle segments") {
        config.circleSegments = 2;
        CHECK_THROWS_AS(tc::validate(config), tc::ConfigError);
    }

    SUBCASE("Geographic working CRS") {
        config.catalogue.front().crs = tc::Crs::wgs84();
        CHECK_THROWS_AS(tc::validate(config), tc::ConfigError);
    }

    SUBCASE("Buffer radius") {
        config.catalogue.back().bufferRadius = 0.0;
        CHECK_THROWS_AS(tc::validate(config), tc::ConfigError);
    }
}
