#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <sstream>

TEST_CASE("Boundary - Loading a FeatureCollection") {
    fixtures::TempDir dir("trackcover_test_boundary");
    const std::string content = R"({
        "type": "FeatureCollection",
        "crs": {"type": "name", "properties": {"name": "urn:ogc:def:crs:OGC:1.3:CRS84"}},
        "features": [
            {
                "type": "Feature",
                "properties": {"ADMIN": "Testland", "ISO_A3": "TST", "POP_EST": 1200},
                "geometry": {
                    "type": "Polygon",
                    "coordinates": [[[-1.0, 50.0], [1.0, 50.0], [1.0, 51.0], [-1.0, 51.0], [-1.0, 50.0]]]
                }
            },
            {
                "type": "Feature",
                "properties": {"ADMIN": "Islands"},
                "geometry": {
                    "type": "MultiPolygon",
                    "coordinates": [
                        [[[10.0, 10.0], [11.0, 10.0], [11.0, 11.0], [10.0, 11.0], [10.0, 10.0]]],
                        [[[12.0, 10.0], [13.0, 10.0], [13.0, 11.0], [12.0, 11.0], [12.0, 10.0]],
                         [[12.2, 10.2], [12.2, 10.8], [12.8, 10.8], [12.8, 10.2], [12.2, 10.2]]]
                    ]
                }
            },
            {
                "type": "Feature",
                "properties": {"NAME": "Fallback"},
                "geometry": {
                    "type": "Polygon",
                    "coordinates": [[[20.0, 0.0], [21.0, 0.0], [21.0, 1.0], [20.0, 1.0], [20.0, 0.0]]]
                }
            },
            {
                "type": "Feature",
                "properties": {"ADMIN": "Nowhere"},
                "geometry": null
            },
            {
                "type": "Feature",
                "properties": {"ADMIN": "Lighthouse"},
                "geometry": {"type": "Point", "coordinates": [0.0, 0.0]}
            }
        ]
    })";
    fixtures::writeFile(dir / "countries.geojson", content);

    auto dataset = tc::BoundaryDataset::load(dir / "countries.geojson");
    REQUIRE(dataset);
    CHECK(dataset->size() == 3);
    CHECK(dataset->contains("Testland"));
    CHECK(dataset->contains("Islands"));
    CHECK(dataset->contains("Fallback"));
    CHECK_FALSE(dataset->contains("Nowhere"));
    CHECK_FALSE(dataset->contains("Lighthouse"));

    SUBCASE("Properties are kept as strings") {
        const auto &testland = dataset->features().front();
        CHECK(testland.properties.at("ISO_A3") == "TST");
        CHECK(testland.properties.at("POP_EST") == "1200");
    }

    SUBCASE("Geometry lookup") {
        auto testland = dataset->geometryOf("Testland");
        REQUIRE(testland);
        CHECK(boost::geometry::area(*testland) == doctest::Approx(2.0));

        auto islands = dataset->geometryOf("Islands");
        REQUIRE(islands);
        CHECK(islands->size() == 2);
        CHECK(boost::geometry::area(*islands) == doctest::Approx(1.0 + 1.0 - 0.36));
        CHECK(boost::geometry::is_valid(*islands));

        CHECK_FALSE(dataset->geometryOf("Atlantis"));
    }

    SUBCASE("Every polygon") { CHECK(dataset->all().size() == 4); }

    SUBCASE("Other name attribute") {
        auto byIso = tc::BoundaryDataset::load(dir / "countries.geojson", "ISO_A3");
        CHECK(byIso->contains("TST"));
        CHECK(byIso->contains("Fallback"));
        CHECK_FALSE(byIso->contains("Testland"));
    }

    SUBCASE("Printing") {
        std::ostringstream oss;
        oss << *dataset;
        CHECK(oss.str().find("FEATURES: 3") == 0);
        CHECK(oss.str().find("Islands: 2 polygon(s)") != std::string::npos);
    }
}

TEST_CASE("Boundary - Bare geometry and Feature documents are wrapped") {
    fixtures::TempDir dir("trackcover_test_boundary_wrap");
    fixtures::writeFile(dir / "feature.geojson", R"({
        "type": "Feature",
        "properties": {"name": "Solo"},
        "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]]}
    })");
    fixtures::writeFile(dir / "polygon.geojson",
                        R"({"type": "Polygon", "coordinates": [[[0, 0], [2, 0], [2, 2], [0, 2], [0, 0]]]})");

    auto feature = tc::BoundaryDataset::load(dir / "feature.geojson");
    CHECK(feature->contains("Solo"));

    auto bare = tc::BoundaryDataset::load(dir / "polygon.geojson");
    REQUIRE(bare->size() == 1);
    CHECK(boost::geometry::area(bare->all()) == doctest::Approx(4.0));
}

TEST_CASE("Boundary - Load errors") {
    fixtures::TempDir dir("trackcover_test_boundary_errors");

    SUBCASE("Missing file") {
        CHECK_THROWS_AS(tc::BoundaryDataset::load(dir / "missing.geojson"), std::runtime_error);
    }

    SUBCASE("Invalid JSON") {
        fixtures::writeFile(dir / "bad.geojson", "{ not json");
        CHECK_THROWS_AS(tc::BoundaryDataset::load(dir / "bad.geojson"), std::runtime_error);
    }

    SUBCASE("Projected dataset") {
        fixtures::writeFile(dir / "projected.geojson", R"({
            "type": "FeatureCollection",
            "crs": {"type": "name", "properties": {"name": "urn:ogc:def:crs:EPSG::27700"}},
            "features": []
        })");
        CHECK_THROWS_AS(tc::BoundaryDataset::load(dir / "projected.geojson"), std::runtime_error);
    }

    SUBCASE("Untyped or incomplete documents") {
        fixtures::writeFile(dir / "untyped.geojson", R"({"features": []})");
        CHECK_THROWS_AS(tc::BoundaryDataset::load(dir / "untyped.geojson"), std::runtime_error);

        fixtures::writeFile(dir / "nofeatures.geojson", R"({"type": "FeatureCollection"})");
        CHECK_THROWS_AS(tc::BoundaryDataset::load(dir / "nofeatures.geojson"), std::runtime_error);
    }
}
