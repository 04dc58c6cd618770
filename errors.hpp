#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Thrown by every operation that is handed a bit depth that is
// not positive, is greater than MAX_BIT_DEPTH, or is odd.
// Nothing has been computed by the time it is thrown.
struct invalid_bit_depth : std::runtime_error {
	int depth;

	invalid_bit_depth(std::string const &what, int nd)
	    : std::runtime_error(what),
	      depth(nd) {
	}
};

#endif
