#include <doctest/doctest.h>

#include "test_helpers.hpp"

namespace dp = ::datapod;

TEST_CASE("Crs - Parsing CRS strings") {
    SUBCASE("Geographic aliases") {
        CHECK(tc::parseCRS("EPSG:4326") == tc::Crs::wgs84());
        CHECK(tc::parseCRS("wgs84") == tc::Crs::wgs84());
        CHECK(tc::parseCRS("WGS") == tc::Crs::wgs84());
        CHECK(tc::parseCRS("epsg:4326").isGeographic());
    }

    SUBCASE("Projected codes") {
        auto crs = tc::parseCRS("EPSG:27700");
        CHECK(crs.kind == tc::CrsKind::Projected);
        CHECK(crs.code == "EPSG:27700");
        CHECK(crs.isLinear());
        CHECK(tc::parseCRS("epsg:3857") == tc::Crs::epsg(3857));
    }

    SUBCASE("Local ENU") {
        auto crs = tc::parseCRS("ENU");
        CHECK(crs.kind == tc::CrsKind::LocalEnu);
        CHECK(crs.isLinear());
    }

    SUBCASE("Unknown strings") {
        CHECK_THROWS_AS(tc::parseCRS("UTM"), tc::ProjectionFailure);
        CHECK_THROWS_AS(tc::parseCRS("EPSG:"), tc::ProjectionFailure);
        CHECK_THROWS_AS(tc::parseCRS("EPSG:12a4"), tc::ProjectionFailure);
        CHECK_THROWS_AS(tc::parseCRS(""), tc::ProjectionFailure);
    }
}

TEST_CASE("Crs - Equality and names") {
    CHECK(tc::Crs::epsg(3857) != tc::Crs::epsg(27700));
    CHECK(tc::Crs::enu(dp::Geo{52.0, 5.0, 0.0}) == tc::Crs::enu(dp::Geo{52.0, 5.0, 0.0}));
    CHECK(tc::Crs::enu(dp::Geo{52.0, 5.0, 0.0}) != tc::Crs::enu(dp::Geo{52.0, 5.1, 0.0}));

    CHECK(tc::Crs::epsg(8857).name() == "EPSG:8857");
    CHECK(tc::Crs::enu(dp::Geo{52.0, 5.0, 0.0}).name().rfind("ENU(", 0) == 0);
}

TEST_CASE("PointSet - Append") {
    auto a = fixtures::points(tc::Crs::wgs84(), {{0.0, 0.0}, {1.0, 1.0}});
    auto b = fixtures::points(tc::Crs::wgs84(), {{2.0, 2.0}});

    SUBCASE("Same CRS keeps order") {
        a.append(b);
        REQUIRE(a.size() == 3);
        CHECK(a.points[2].longitude() == doctest::Approx(2.0));
        CHECK(a.points[0].latitude() == doctest::Approx(0.0));
    }

    SUBCASE("Empty set adopts the CRS") {
        tc::PointSet empty;
        auto projected = fixtures::points(tc::Crs::epsg(3857), {{10.0, 10.0}});
        empty.append(projected);
        CHECK(empty.crs == tc::Crs::epsg(3857));
        CHECK(empty.size() == 1);
    }

    SUBCASE("Mixing CRSs is rejected") {
        auto projected = fixtures::points(tc::Crs::epsg(3857), {{10.0, 10.0}});
        CHECK_THROWS_AS(a.append(projected), tc::ProjectionFailure);
        CHECK(a.size() == 2);
    }
}

TEST_CASE("Predicate - Names") {
    CHECK(std::string(tc::toString(tc::Predicate::Within)) == "within");
    CHECK(std::string(tc::toString(tc::Predicate::Intersects)) == "intersects");
    CHECK(std::string(tc::toString(tc::Predicate::All)) == "all");
}
