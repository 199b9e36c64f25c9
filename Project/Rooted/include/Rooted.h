#pragma once

#include <source_location>
#include <type_traits>
#include <utility>

#include "RootedAPI.h"
#include "Logging.hpp"
#include "Invariant.hpp"
#include "Identity/PositionId.hpp"
#include "Identity/CallTree.hpp"
#include "Store/TypeTag.hpp"
#include "Store/Slot.hpp"
#include "Store/SlotStore.hpp"
#include "Handles/StateHandle.hpp"
#include "Handles/ContextHandle.hpp"
#include "Settings/StoreSettings.hpp"

// Hook-style entry points over the process-wide SlotStore and the calling
// thread's CallTree. Code that owns its own store calls SlotStore directly.
namespace Rooted {

	// Creates state at this call site on first visit, reuses it afterwards.
	template <typename F>
	StateHandle<RootedType<F>> UseState(F&& initializer, const std::source_location& location = std::source_location::current()) {
		return SlotStore::GetInstance().Root(std::forward<F>(initializer), location);
	}

	template <typename T>
	ContextHandle<T> CreateContext(T initial) {
		return SlotStore::GetInstance().CreateContext(std::move(initial));
	}

	inline void Sweep() {
		SlotStore::GetInstance().Sweep();
	}

	// Runs body one scope deeper, keyed by this call site.
	template <typename F>
	decltype(auto) Nested(F&& body, const std::source_location& location = std::source_location::current()) {
		return CallTree::Current().EnterScope(CallSite::From(location), std::forward<F>(body));
	}

	// Runs body one scope deeper, keyed by this call site and 'key'.
	template <typename Key, typename F>
	decltype(auto) CallInSlot(const Key& key, F&& body, const std::source_location& location = std::source_location::current()) {
		return CallTree::Current().CallInSlot(CallSite::From(location), key, std::forward<F>(body));
	}

	// One host cycle: traverses body from a fresh root, then sweeps.
	template <typename F>
	void RunFrame(F&& body) {
		static_assert(std::is_void_v<std::invoke_result_t<F&>>, "RunFrame bodies return nothing");
		CallTree::Current().Root(std::forward<F>(body));
		Sweep();
	}

}
