#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <source_location>
#include <string_view>

#include "RootedAPI.h"

namespace Rooted {

	// 64-bit FNV-1a, used for call-site tokens and id mixing
	constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ull;
	constexpr uint64_t FNV_PRIME = 1099511628211ull;

	constexpr uint64_t HashBytes(std::string_view bytes, uint64_t seed = FNV_OFFSET_BASIS) {
		uint64_t hash = seed;
		for (char c : bytes) {
			hash ^= static_cast<uint8_t>(c);
			hash *= FNV_PRIME;
		}
		return hash;
	}

	constexpr uint64_t HashCombine(uint64_t seed, uint64_t value) {
		// splitmix64 finalizer over the xor keeps nearby inputs apart
		uint64_t x = seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
		x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
		x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
		return x ^ (x >> 31);
	}

	// Stable identity of a point in a traversal of nested scopes.
	class PositionId {
	public:
		constexpr PositionId() = default;
		constexpr explicit PositionId(uint64_t value) : value(value) {}

		// Identity of the outermost scope of every traversal.
		static constexpr PositionId Root() { return PositionId(HashBytes("rooted::root")); }

		// Child identity: parent combined with a scope component and the
		// number of earlier siblings sharing that component.
		constexpr PositionId Child(uint64_t component, uint32_t occurrence) const {
			return PositionId(HashCombine(HashCombine(value, component), occurrence));
		}

		constexpr uint64_t Value() const { return value; }

		constexpr bool operator==(const PositionId& other) const { return value == other.value; }
		constexpr bool operator!=(const PositionId& other) const { return value != other.value; }
		constexpr bool operator<(const PositionId& other) const { return value < other.value; }

	private:
		uint64_t value = 0;
	};

	inline std::ostream& operator<<(std::ostream& os, const PositionId& id) {
		return os << "PositionId(0x" << std::hex << id.Value() << std::dec << ")";
	}

	// Where a scope was entered from.
	struct CallSite {
		const char* file = "";
		const char* function = "";
		uint32_t line = 0;
		uint32_t column = 0;

		static CallSite From(const std::source_location& location) {
			return CallSite{ location.file_name(), location.function_name(), location.line(), location.column() };
		}

		// Function names differ between compilers, so only the file and
		// coordinates feed the token.
		uint64_t Token() const {
			uint64_t hash = HashBytes(file);
			hash = HashCombine(hash, line);
			return HashCombine(hash, column);
		}
	};

}

template <>
struct std::hash<Rooted::PositionId> {
	size_t operator()(const Rooted::PositionId& id) const noexcept {
		return static_cast<size_t>(id.Value());
	}
};
