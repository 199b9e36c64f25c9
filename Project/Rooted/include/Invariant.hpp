#pragma once

#include <string>

#include "RootedAPI.h"

namespace Rooted {

	// Reports a broken internal invariant (store corruption, unbalanced scope
	// stack) and terminates. These indicate a bug in Rooted, not a usage
	// mistake, so they are never surfaced as recoverable errors.
	[[noreturn]] void ROOTED_API FatalInvariant(const std::string& message);

}
