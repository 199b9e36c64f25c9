#include "pch.h"
#include "Store/TypeTag.hpp"

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace Rooted {

	namespace {
		struct TypeNameTable {
			std::mutex mutex;
			std::vector<std::string> names; // Indexed by tag.
		};

		TypeNameTable& GetTypeNameTable() {
			static TypeNameTable table;
			return table;
		}
	}

	TypeTag TypeTags::Register(const std::string& typeName) {
		TypeNameTable& table = GetTypeNameTable();
		std::lock_guard<std::mutex> lock(table.mutex);

		TypeTag tag = static_cast<TypeTag>(table.names.size());
		table.names.push_back(typeName);
		return tag;
	}

	std::string TypeTags::NameOf(TypeTag tag) {
		TypeNameTable& table = GetTypeNameTable();
		std::lock_guard<std::mutex> lock(table.mutex);

		if (tag >= table.names.size()) {
			return "<unregistered>";
		}
		return table.names[tag];
	}

	uint32_t TypeTags::RegisteredCount() {
		TypeNameTable& table = GetTypeNameTable();
		std::lock_guard<std::mutex> lock(table.mutex);
		return static_cast<uint32_t>(table.names.size());
	}

	std::string TypeTags::ReadableName(const char* rawName) {
		std::string name = rawName;

#if defined(__GNUG__)
		// GCC/Clang return mangled names
		int status = 0;
		char* demangled = abi::__cxa_demangle(rawName, nullptr, nullptr, &status);
		if (status == 0 && demangled) {
			name = demangled;
		}
		std::free(demangled);
#endif

		// On MSVC, typeid().name() returns "class ClassName"
		if (name.find("struct ") == 0) {
			name = name.substr(7);
		}
		else if (name.find("class ") == 0) {
			name = name.substr(6);
		}
		return name;
	}

}
