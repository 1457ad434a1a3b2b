#pragma once

#include "error.hpp"

// Returns the ErrorCode thrown by f, or 0 if nothing was thrown
template <typename F>
static int thrown_error(F f) {
	try {
		f();
	} catch (ErrorCode e) {
		return static_cast<int>(e);
	}
	return 0;
}
