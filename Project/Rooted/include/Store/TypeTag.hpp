#pragma once

#include <cstdint>
#include <string>
#include <typeinfo>

#include "RootedAPI.h"

namespace Rooted {

	// Process-wide identity of a stored value type.
	using TypeTag = uint32_t;

	class ROOTED_API TypeTags {
	public:
		// Assigned once, the first time T is stored anywhere in the process.
		template <typename T>
		static TypeTag Of() {
			static const TypeTag tag = Register(ReadableName(typeid(T).name()));
			return tag;
		}

		// Readable name recorded when the tag was assigned, for diagnostics.
		static std::string NameOf(TypeTag tag);

		static uint32_t RegisteredCount();

	private:
		static TypeTag Register(const std::string& typeName);
		static std::string ReadableName(const char* rawName);
	};

}
