#include <stdio.h>
#include <stdlib.h>
#include <limits.h>
#include <math.h>
#include <cmath>
#include <string>
#include "options.hpp"
#include "geohash.hpp"
#include "errors.hpp"

/**
 * Parses `text` as a bit depth, prefixing any error message with `where`.
 * Throws invalid_bit_depth if it is a number but not a usable depth,
 * and std::runtime_error if it is not an integer at all.
 */
int parse_bit_depth(std::string where, std::string text) {
	const char *s = text.c_str();
	char *end;
	double d = strtod(s, &end);

	if (end == s || *end != '\0' || !std::isfinite(d) || d != floor(d) || d < INT_MIN || d > INT_MAX) {
		throw std::runtime_error(where + ": Expected an integer bit depth, not \"" + text + "\"");
	}

	int bit_depth = d;
	try {
		validate_bit_depth(bit_depth);
	} catch (invalid_bit_depth const &e) {
		throw invalid_bit_depth(where + ": " + e.what(), e.depth);
	}

	return bit_depth;
}

int default_bit_depth() {
	const char *GEOHASH_INT_BIT_DEPTH = getenv("GEOHASH_INT_BIT_DEPTH");
	if (GEOHASH_INT_BIT_DEPTH == NULL || *GEOHASH_INT_BIT_DEPTH == '\0') {
		return MAX_BIT_DEPTH;
	}

	try {
		return parse_bit_depth("GEOHASH_INT_BIT_DEPTH", GEOHASH_INT_BIT_DEPTH);
	} catch (std::runtime_error const &e) {
		fprintf(stderr, "%s; using %d instead\n", e.what(), MAX_BIT_DEPTH);
		return MAX_BIT_DEPTH;
	}
}
