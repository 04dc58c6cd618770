#ifndef PRECISION_HPP
#define PRECISION_HPP

#include <stddef.h>

// Approximate radius, in meters, of a cell at each even bit depth from 4 to 52
struct bit_depth_meters {
	int bits;
	double meters;
};

extern const bit_depth_meters bits_to_meters[];
extern const size_t bits_to_meters_count;

int geohash_find_bit_depth(double distance_meters);
double geohash_bit_depth_meters(int bit_depth);

#endif
