#ifndef NEIGHBOR_HPP
#define NEIGHBOR_HPP

#include <vector>
#include "geohash.hpp"

// A step from one cell to another, counted in whole cells.
//
//   NW (1,-1)   N (1,0)    NE (1,1)
//   W  (0,-1)   X          E  (0,1)
//   SW (-1,-1)  S (-1,0)   SE (-1,1)
struct bearing {
	int lat;
	int lon;
};

extern const bearing NORTH;
extern const bearing NORTH_EAST;
extern const bearing EAST;
extern const bearing SOUTH_EAST;
extern const bearing SOUTH;
extern const bearing SOUTH_WEST;
extern const bearing WEST;
extern const bearing NORTH_WEST;

geohash_t geohash_neighbor(geohash_t hash, bearing direction, int bit_depth);

// N, NE, E, SE, S, SW, W, NW, and then `hash` itself
std::vector<geohash_t> geohash_neighbors(geohash_t hash, int bit_depth);

std::vector<geohash_t> geohash_bboxes(double minlat, double minlon, double maxlat, double maxlon, int bit_depth);
std::vector<geohash_t> geohash_bboxes(geohash_bbox const &region, int bit_depth);

#endif
