#include "pch.h"
#include "Invariant.hpp"
#include "Logging.hpp"

namespace Rooted {

	void FatalInvariant(const std::string& message) {
		ROOTED_PRINT(RootedLogging::LogLevel::Critical, "[Rooted] Invariant violated: ", message);
		RootedLogging::Flush();

		// Also reach stderr when logging was never initialized
		std::cerr << "[Rooted] Invariant violated: " << message << std::endl;
		std::abort();
	}

}
