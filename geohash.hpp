#ifndef GEOHASH_HPP
#define GEOHASH_HPP

#include <mapbox/geometry/point.hpp>
#include <mapbox/geometry/box.hpp>

// Both the deepest and the default precision of an integer geohash
#define MAX_BIT_DEPTH 52

// An integer geohash. Bits are consumed in pairs, longitude then latitude,
// most significant first. The value does not carry its own bit depth, so the
// depth used to encode it has to be passed again to decode it.
typedef long long geohash_t;

// x is longitude, y is latitude
typedef mapbox::geometry::point<double> geohash_lonlat;
typedef mapbox::geometry::box<double> geohash_bbox;

// The centre of a cell and the largest distance, along each axis,
// of any point in the cell from that centre.
struct geohash_point {
	double lat = 0;
	double lon = 0;
	double lat_err = 0;
	double lon_err = 0;
};

void validate_bit_depth(int bit_depth);

geohash_t geohash_encode(double lat, double lon, int bit_depth);
geohash_point geohash_decode(geohash_t hash, int bit_depth);
geohash_bbox geohash_decode_bbox(geohash_t hash, int bit_depth);

geohash_t get_bit(geohash_t hash, int position);

// Realign a hash encoded at a coarser depth to MAX_BIT_DEPTH
geohash_t geohash_shift(geohash_t value, int bit_depth);

#endif
