#include <cmath>
#include <vector>
#include "neighbor.hpp"
#include "geohash.hpp"

const bearing NORTH = {1, 0};
const bearing NORTH_EAST = {1, 1};
const bearing EAST = {0, 1};
const bearing SOUTH_EAST = {-1, 1};
const bearing SOUTH = {-1, 0};
const bearing SOUTH_WEST = {-1, -1};
const bearing WEST = {0, -1};
const bearing NORTH_WEST = {1, -1};

// This assumes that the cells around `hash` are all the same size as it is,
// so it is only an approximation. Next to the poles it will step off the edge
// of the world, and across the antimeridian it does not wrap around.
geohash_t geohash_neighbor(geohash_t hash, bearing direction, int bit_depth) {
	validate_bit_depth(bit_depth);

	geohash_point p = geohash_decode(hash, bit_depth);

	// the errors are half a cell wide
	double lat = p.lat + direction.lat * p.lat_err * 2;
	double lon = p.lon + direction.lon * p.lon_err * 2;

	return geohash_encode(lat, lon, bit_depth);
}

std::vector<geohash_t> geohash_neighbors(geohash_t hash, int bit_depth) {
	validate_bit_depth(bit_depth);

	static const bearing bearings[] = {
		NORTH, NORTH_EAST, EAST, SOUTH_EAST, SOUTH, SOUTH_WEST, WEST, NORTH_WEST,
	};

	std::vector<geohash_t> out;
	for (auto const &b : bearings) {
		out.push_back(geohash_neighbor(hash, b, bit_depth));
	}
	out.push_back(hash);

	return out;
}

// All the cells, starting from the one that contains the southwest corner,
// that it takes to cover the region. There may be duplicates if the region
// is smaller than a cell.
std::vector<geohash_t> geohash_bboxes(double minlat, double minlon, double maxlat, double maxlon, int bit_depth) {
	validate_bit_depth(bit_depth);

	geohash_t sw = geohash_encode(minlat, minlon, bit_depth);
	geohash_t ne = geohash_encode(maxlat, maxlon, bit_depth);

	geohash_point p = geohash_decode(sw, bit_depth);
	double per_lat = p.lat_err * 2;
	double per_lon = p.lon_err * 2;

	geohash_bbox swbox = geohash_decode_bbox(sw, bit_depth);
	geohash_bbox nebox = geohash_decode_bbox(ne, bit_depth);

	long long lat_steps = std::round((nebox.min.y - swbox.min.y) / per_lat);
	long long lon_steps = std::round((nebox.max.x - swbox.max.x) / per_lon);

	std::vector<geohash_t> out;
	for (long long i = 0; i <= lat_steps; i++) {
		for (long long j = 0; j <= lon_steps; j++) {
			out.push_back(geohash_neighbor(sw, bearing{(int) i, (int) j}, bit_depth));
		}
	}

	return out;
}

std::vector<geohash_t> geohash_bboxes(geohash_bbox const &region, int bit_depth) {
	return geohash_bboxes(region.min.y, region.min.x, region.max.y, region.max.x, bit_depth);
}
