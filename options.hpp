#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <string>

int parse_bit_depth(std::string where, std::string text);

// The bit depth named by $GEOHASH_INT_BIT_DEPTH, or MAX_BIT_DEPTH
int default_bit_depth();

#endif
