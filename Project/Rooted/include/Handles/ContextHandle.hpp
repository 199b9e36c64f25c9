#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "Store/SlotStore.hpp"

namespace Rooted {

	template <typename T>
	class ContextOverride;

	// Handle to the single value of type T reachable from anywhere, regardless
	// of position. Reads and writes see the innermost scoped override when one
	// is active and touch the context for the current sweep window.
	//
	// If a sweep evicted the context, the next access through this handle
	// re-establishes it from the initial value the handle was created with.
	//
	// Readers passed to Get() run under the context's lock and must not access
	// the same context again.
	template <typename T>
	class ContextHandle {
	public:
		ContextHandle(SlotStore& store, std::shared_ptr<ContextSlot<T>> slot, T initial)
			: store(&store), slot(std::move(slot)), initial(std::move(initial)) {}

		T Get() {
			return Acquire()->Read([](const T& value) { return value; });
		}

		// Returns the reader's result by value; a reference into the context
		// would outlive the lock and any override it points into.
		template <typename F>
		std::decay_t<std::invoke_result_t<F&, const T&>> Get(F&& reader) {
			return Acquire()->Read(std::forward<F>(reader));
		}

		void Set(T value) {
			Acquire()->Write(std::move(value));
		}

		// Runs body with 'value' overriding the context, restoring the previous
		// value on every exit path.
		template <typename F>
		decltype(auto) Provide(T value, F&& body) {
			ContextOverride<T> scope(*this, std::move(value));
			return std::forward<F>(body)();
		}

		size_t OverrideDepth() const { return slot->OverrideDepth(); }

		bool IsDetached() const { return slot->IsDetached(); }

	private:
		friend class ContextOverride<T>;

		const std::shared_ptr<ContextSlot<T>>& Acquire() {
			if (slot->IsDetached()) {
				slot = store->RootContext<T>(initial);
			}
			else {
				slot->Touch();
			}
			return slot;
		}

		SlotStore* store;
		std::shared_ptr<ContextSlot<T>> slot;
		T initial;
	};

	// RAII override: pushes a value for T on construction, pops it on destruction.
	template <typename T>
	class ContextOverride {
	public:
		ContextOverride(ContextHandle<T>& handle, T value)
			: slot(handle.Acquire())
			, depth(slot->PushOverride(std::move(value))) {
		}

		~ContextOverride() {
			if (!slot->PopOverride(depth)) {
				FatalInvariant("context overrides for " + TypeTags::NameOf(slot->GetTypeTag()) + " were popped out of order");
			}
		}

		// Disable copy and move
		ContextOverride(const ContextOverride&) = delete;
		ContextOverride& operator=(const ContextOverride&) = delete;

	private:
		std::shared_ptr<ContextSlot<T>> slot;
		size_t depth;
	};

	template <typename T>
	ContextHandle<T> SlotStore::CreateContext(T initial) {
		std::shared_ptr<ContextSlot<T>> slot = RootContext<T>(initial);
		return ContextHandle<T>(*this, std::move(slot), std::move(initial));
	}

}
