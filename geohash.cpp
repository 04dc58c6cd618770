#include <string>
#include "geohash.hpp"
#include "errors.hpp"

void validate_bit_depth(int bit_depth) {
	if (bit_depth > MAX_BIT_DEPTH || bit_depth <= 0) {
		throw invalid_bit_depth("bitDepth must be greater than 0 and less than or equal to " + std::to_string(MAX_BIT_DEPTH) + ", was " + std::to_string(bit_depth), bit_depth);
	}
	if (bit_depth % 2 != 0) {
		throw invalid_bit_depth("bitDepth must be even, was " + std::to_string(bit_depth), bit_depth);
	}
}

// Each step halves the cell along one axis, longitude first.
// A coordinate exactly on the midpoint goes to the lower half.
geohash_t geohash_encode(double lat, double lon, int bit_depth) {
	validate_bit_depth(bit_depth);

	double minlat = -90, maxlat = 90;
	double minlon = -180, maxlon = 180;
	geohash_t hash = 0;

	for (int i = 0; i < bit_depth; i++) {
		hash <<= 1;

		if (i % 2 == 0) {
			double mid = (minlon + maxlon) / 2;
			if (lon > mid) {
				hash |= 1;
				minlon = mid;
			} else {
				maxlon = mid;
			}
		} else {
			double mid = (minlat + maxlat) / 2;
			if (lat > mid) {
				hash |= 1;
				minlat = mid;
			} else {
				maxlat = mid;
			}
		}
	}

	return hash;
}

geohash_t get_bit(geohash_t hash, int position) {
	return (hash / (1LL << position)) & 1;
}

geohash_bbox geohash_decode_bbox(geohash_t hash, int bit_depth) {
	validate_bit_depth(bit_depth);

	double minlat = -90, maxlat = 90;
	double minlon = -180, maxlon = 180;
	int steps = bit_depth / 2;

	// the highest pair of bits is the first bisection
	for (int step = 0; step < steps; step++) {
		geohash_t lonbit = get_bit(hash, (steps - step) * 2 - 1);
		geohash_t latbit = get_bit(hash, (steps - step) * 2 - 2);

		if (latbit == 0) {
			maxlat = (minlat + maxlat) / 2;
		} else {
			minlat = (minlat + maxlat) / 2;
		}

		if (lonbit == 0) {
			maxlon = (minlon + maxlon) / 2;
		} else {
			minlon = (minlon + maxlon) / 2;
		}
	}

	return geohash_bbox(geohash_lonlat(minlon, minlat), geohash_lonlat(maxlon, maxlat));
}

geohash_point geohash_decode(geohash_t hash, int bit_depth) {
	geohash_bbox bbox = geohash_decode_bbox(hash, bit_depth);

	geohash_point p;
	p.lat = (bbox.min.y + bbox.max.y) / 2;
	p.lon = (bbox.min.x + bbox.max.x) / 2;
	p.lat_err = bbox.max.y - p.lat;
	p.lon_err = bbox.max.x - p.lon;
	return p;
}

geohash_t geohash_shift(geohash_t value, int bit_depth) {
	validate_bit_depth(bit_depth);

	// left-shifting a negative signed value is undefined before C++20
	return (geohash_t) ((unsigned long long) value << (MAX_BIT_DEPTH - bit_depth));
}
