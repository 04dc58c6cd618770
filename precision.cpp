#include <stddef.h>
#include "precision.hpp"
#include "geohash.hpp"

// https://github.com/yinqiwen/ardb/blob/master/doc/spatial-index.md
//
// Must stay in ascending order of bits: geohash_find_bit_depth()
// takes the first entry that is big enough.
const bit_depth_meters bits_to_meters[] = {
	{4, 10018863},
	{6, 5009431},
	{8, 2504715.5},
	{10, 1252357.75},
	{12, 626178.875},
	{14, 313089.4375},
	{16, 156544.7188},
	{18, 78272.35938},
	{20, 39136.1797},
	{22, 19568.0898},
	{24, 9784.0449},
	{26, 4892.0224},
	{28, 2446.0112},
	{30, 1223.0056},
	{32, 611.5028},
	{34, 305.751},
	{36, 152.8757},
	{38, 76.4378},
	{40, 38.2189},
	{42, 19.1095},
	{44, 9.5547},
	{46, 4.7774},
	{48, 2.3889},
	{50, 1.1943},
	{52, 0.5971},
};

const size_t bits_to_meters_count = sizeof(bits_to_meters) / sizeof(bits_to_meters[0]);

// Returns 0, which is never a valid bit depth, if no cell is as big as the distance.
int geohash_find_bit_depth(double distance_meters) {
	for (size_t i = 0; i < bits_to_meters_count; i++) {
		if (bits_to_meters[i].meters > distance_meters) {
			return MAX_BIT_DEPTH - bits_to_meters[i].bits;
		}
	}

	return 0;
}

double geohash_bit_depth_meters(int bit_depth) {
	validate_bit_depth(bit_depth);

	for (size_t i = 0; i < bits_to_meters_count; i++) {
		if (bits_to_meters[i].bits == bit_depth) {
			return bits_to_meters[i].meters;
		}
	}

	// 2 bits is a quarter of the world, which the table doesn't cover
	return 0;
}
