#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <stdlib.h>
#include <cmath>
#include <vector>
#include <algorithm>
#include "geohash.hpp"
#include "neighbor.hpp"
#include "precision.hpp"
#include "options.hpp"
#include "errors.hpp"

static bool contains(std::vector<geohash_t> const &v, geohash_t h) {
	return std::find(v.begin(), v.end(), h) != v.end();
}

TEST_CASE("Encode", "[encode]") {
	REQUIRE(geohash_encode(37.8324, 112.5584, 52) == 4064984913515641);

	// 2 bits: one longitude bisection, then one latitude bisection
	REQUIRE(geohash_encode(-45, -90, 2) == 0);
	REQUIRE(geohash_encode(45, -90, 2) == 1);
	REQUIRE(geohash_encode(-45, 90, 2) == 2);
	REQUIRE(geohash_encode(45, 90, 2) == 3);

	// the midpoint itself belongs to the lower half
	REQUIRE(geohash_encode(0, 0, 2) == 0);
	REQUIRE(geohash_encode(90, 180, 4) == 15);
	REQUIRE(geohash_encode(-90, -180, 4) == 0);
}

TEST_CASE("Decode", "[decode]") {
	geohash_point p = geohash_decode(4064984913515641, 52);
	REQUIRE(std::fabs(p.lat - 37.8324) <= 0.0001);
	REQUIRE(std::fabs(p.lon - 112.5584) <= 0.0001);

	p = geohash_decode(0, 2);
	REQUIRE(p.lat == -45);
	REQUIRE(p.lon == -90);
	REQUIRE(p.lat_err == 45);
	REQUIRE(p.lon_err == 90);
}

TEST_CASE("Decode bbox", "[decode]") {
	geohash_bbox bbox = geohash_decode_bbox(4064984913515641, 52);
	REQUIRE(std::fabs(bbox.min.y - 37.8324) <= 0.0001);
	REQUIRE(std::fabs(bbox.min.x - 112.5584) <= 0.0001);
	REQUIRE(std::fabs(bbox.max.y - 37.8324) <= 0.0001);
	REQUIRE(std::fabs(bbox.max.x - 112.5584) <= 0.0001);

	bbox = geohash_decode_bbox(9, 4);
	REQUIRE(bbox.min.y == -45);
	REQUIRE(bbox.max.y == 0);
	REQUIRE(bbox.min.x == 0);
	REQUIRE(bbox.max.x == 90);
}

TEST_CASE("Decoded point is within error of the encoded point", "[decode]") {
	for (double lat = -89.5; lat < 90; lat += 7.25) {
		for (double lon = -179.5; lon < 180; lon += 13.75) {
			for (int depth = 2; depth <= MAX_BIT_DEPTH; depth += 2) {
				geohash_t h = geohash_encode(lat, lon, depth);
				REQUIRE(h >= 0);
				REQUIRE(h < (1LL << depth));

				geohash_point p = geohash_decode(h, depth);
				REQUIRE(std::fabs(lat - p.lat) <= p.lat_err);
				REQUIRE(std::fabs(lon - p.lon) <= p.lon_err);

				geohash_bbox bbox = geohash_decode_bbox(h, depth);
				REQUIRE(bbox.min.y <= bbox.max.y);
				REQUIRE(bbox.min.x <= bbox.max.x);
				REQUIRE(p.lat >= bbox.min.y);
				REQUIRE(p.lat <= bbox.max.y);
				REQUIRE(p.lon >= bbox.min.x);
				REQUIRE(p.lon <= bbox.max.x);
			}
		}
	}
}

TEST_CASE("Each two bits of depth halve the error", "[decode]") {
	double lat = 37.8324, lon = 112.5584;

	geohash_point prev = geohash_decode(geohash_encode(lat, lon, 2), 2);
	for (int depth = 4; depth <= MAX_BIT_DEPTH; depth += 2) {
		geohash_point p = geohash_decode(geohash_encode(lat, lon, depth), depth);
		REQUIRE(p.lat_err < prev.lat_err);
		REQUIRE(p.lon_err < prev.lon_err);
		REQUIRE(p.lat_err == prev.lat_err / 2);
		REQUIRE(p.lon_err == prev.lon_err / 2);
		prev = p;
	}
}

TEST_CASE("Get bit", "[bits]") {
	REQUIRE(get_bit(5, 0) == 1);
	REQUIRE(get_bit(5, 1) == 0);
	REQUIRE(get_bit(5, 2) == 1);
	REQUIRE(get_bit(5, 3) == 0);
	REQUIRE(get_bit(1LL << 51, 51) == 1);
	REQUIRE(get_bit(1LL << 51, 50) == 0);
}

TEST_CASE("Neighbor", "[neighbor]") {
	REQUIRE(geohash_neighbor(1702789509, NORTH, 32) == 1702789520);
	REQUIRE(geohash_neighbor(27898503327470, SOUTH_WEST, 46) == 27898503327465);
}

TEST_CASE("Neighbor and back again", "[neighbor]") {
	for (double lat = -80; lat <= 80; lat += 10) {
		for (double lon = -160; lon <= 160; lon += 16) {
			for (int depth = 10; depth <= MAX_BIT_DEPTH; depth += 6) {
				geohash_t h = geohash_encode(lat, lon, depth);

				REQUIRE(geohash_neighbor(geohash_neighbor(h, NORTH, depth), SOUTH, depth) == h);
				REQUIRE(geohash_neighbor(geohash_neighbor(h, EAST, depth), WEST, depth) == h);
				REQUIRE(geohash_neighbor(geohash_neighbor(h, NORTH_EAST, depth), SOUTH_WEST, depth) == h);
			}
		}
	}
}

TEST_CASE("Neighbors", "[neighbor]") {
	std::vector<geohash_t> expected = {1702789520, 1702789522, 1702789511, 1702789510, 1702789508, 1702789422, 1702789423, 1702789434, 1702789509};
	std::vector<geohash_t> results = geohash_neighbors(1702789509, 32);

	REQUIRE(results.size() == 9);
	REQUIRE(results == expected);
	REQUIRE(results[8] == 1702789509);

	for (auto const &h : expected) {
		REQUIRE(contains(results, h));
	}
}

TEST_CASE("Neighbors at the edge of the world", "[neighbor]") {
	// nothing is north of the northeast quadrant, so north finds itself
	std::vector<geohash_t> results = geohash_neighbors(3, 2);
	REQUIRE(results.size() == 9);
	REQUIRE(results[0] == 3);
	REQUIRE(results[8] == 3);
}

TEST_CASE("Bboxes", "[bboxes]") {
	std::vector<geohash_t> results = geohash_bboxes(30, 120, 30.0001, 120.0001, 50);
	REQUIRE(contains(results, geohash_encode(30.0001, 120.0001, 50)));
	REQUIRE(contains(results, geohash_encode(30, 120, 50)));
	REQUIRE(results.size() == 190);

	// three by three quarter-hemisphere cells, south to north, west to east
	std::vector<geohash_t> expected = {0, 2, 8, 1, 3, 9, 4, 6, 12};
	REQUIRE(geohash_bboxes(-80, -170, 10, 10, 4) == expected);
	REQUIRE(geohash_bboxes(geohash_bbox(geohash_lonlat(-170, -80), geohash_lonlat(10, 10)), 4) == expected);
}

TEST_CASE("Bboxes smaller than a cell", "[bboxes]") {
	std::vector<geohash_t> results = geohash_bboxes(30, 120, 30.0001, 120.0001, 10);
	REQUIRE(results.size() == 1);
	REQUIRE(results[0] == geohash_encode(30, 120, 10));
}

TEST_CASE("Bit depth validation", "[validate]") {
	for (int depth = 2; depth <= MAX_BIT_DEPTH; depth += 2) {
		REQUIRE_NOTHROW(validate_bit_depth(depth));
	}

	REQUIRE_THROWS_AS(validate_bit_depth(-1), invalid_bit_depth);
	REQUIRE_THROWS_AS(validate_bit_depth(0), invalid_bit_depth);
	REQUIRE_THROWS_AS(validate_bit_depth(53), invalid_bit_depth);
	REQUIRE_THROWS_AS(validate_bit_depth(51), invalid_bit_depth);
	REQUIRE_THROWS_AS(validate_bit_depth(54), invalid_bit_depth);

	REQUIRE_THROWS_WITH(validate_bit_depth(53), "bitDepth must be greater than 0 and less than or equal to 52, was 53");
	REQUIRE_THROWS_WITH(validate_bit_depth(51), "bitDepth must be even, was 51");

	try {
		validate_bit_depth(7);
		FAIL("7 should be rejected");
	} catch (invalid_bit_depth const &e) {
		REQUIRE(e.depth == 7);
	}
}

TEST_CASE("Every operation validates the bit depth", "[validate]") {
	REQUIRE_THROWS_AS(geohash_encode(0, 0, 51), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_decode(0, 0), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_decode_bbox(0, 53), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_neighbor(0, NORTH, -1), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_neighbors(0, 3), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_bboxes(0, 0, 1, 1, 0), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_shift(1, 64), invalid_bit_depth);
	REQUIRE_THROWS_AS(geohash_bit_depth_meters(5), invalid_bit_depth);
}

TEST_CASE("Find bit depth", "[precision]") {
	// the table is searched from the coarsest cells up
	REQUIRE(geohash_find_bit_depth(0) == 48);
	REQUIRE(geohash_find_bit_depth(100) == 48);
	REQUIRE(geohash_find_bit_depth(10018862) == 48);

	// no cell is bigger than these
	REQUIRE(geohash_find_bit_depth(10018863) == 0);
	REQUIRE(geohash_find_bit_depth(40000000) == 0);
}

TEST_CASE("Bit depth meters", "[precision]") {
	REQUIRE(bits_to_meters_count == (size_t) 25);
	for (size_t i = 1; i < bits_to_meters_count; i++) {
		REQUIRE(bits_to_meters[i].bits == bits_to_meters[i - 1].bits + 2);
		REQUIRE(bits_to_meters[i].meters < bits_to_meters[i - 1].meters);
	}

	REQUIRE(geohash_bit_depth_meters(52) == 0.5971);
	REQUIRE(geohash_bit_depth_meters(32) == 611.5028);
	REQUIRE(geohash_bit_depth_meters(4) == 10018863);
	REQUIRE(geohash_bit_depth_meters(2) == 0);
}

TEST_CASE("Shift", "[shift]") {
	REQUIRE(geohash_shift(1, 52) == 1);
	REQUIRE(geohash_shift(1, 50) == 4);
	REQUIRE(geohash_shift(3, 2) == 3LL << 50);

	// a coarser hash lines up with the prefix of the finer one
	geohash_t coarse = geohash_encode(37.8324, 112.5584, 50);
	geohash_t fine = geohash_encode(37.8324, 112.5584, 52);
	REQUIRE(geohash_shift(coarse, 50) == (fine & ~3LL));
	REQUIRE(geohash_shift(coarse, 50) == 4064984913515640);
}

TEST_CASE("Parse bit depth", "[options]") {
	REQUIRE(parse_bit_depth("test", "26") == 26);
	REQUIRE(parse_bit_depth("test", "52") == 52);

	REQUIRE_THROWS_AS(parse_bit_depth("test", "27"), invalid_bit_depth);
	REQUIRE_THROWS_AS(parse_bit_depth("test", "0"), invalid_bit_depth);
	REQUIRE_THROWS_WITH(parse_bit_depth("test", "51"), "test: bitDepth must be even, was 51");

	REQUIRE_THROWS_AS(parse_bit_depth("test", ""), std::runtime_error);
	REQUIRE_THROWS_AS(parse_bit_depth("test", "deep"), std::runtime_error);
	REQUIRE_THROWS_AS(parse_bit_depth("test", "26.5"), std::runtime_error);
	REQUIRE_THROWS_AS(parse_bit_depth("test", "26 bits"), std::runtime_error);
	REQUIRE_THROWS_WITH(parse_bit_depth("test", "deep"), "test: Expected an integer bit depth, not \"deep\"");
}

TEST_CASE("Default bit depth", "[options]") {
	unsetenv("GEOHASH_INT_BIT_DEPTH");
	REQUIRE(default_bit_depth() == MAX_BIT_DEPTH);

	setenv("GEOHASH_INT_BIT_DEPTH", "32", 1);
	REQUIRE(default_bit_depth() == 32);

	// malformed settings are reported and ignored
	setenv("GEOHASH_INT_BIT_DEPTH", "33", 1);
	REQUIRE(default_bit_depth() == MAX_BIT_DEPTH);
	setenv("GEOHASH_INT_BIT_DEPTH", "fine", 1);
	REQUIRE(default_bit_depth() == MAX_BIT_DEPTH);

	unsetenv("GEOHASH_INT_BIT_DEPTH");
}
