#pragma once

#include <memory>
#include <utility>

#include "Store/Slot.hpp"

namespace Rooted {

	// Capability bound to one rooted slot. Every access marks the slot as
	// touched for the current sweep window.
	//
	// Handles share ownership of the value, so one obtained before a sweep
	// stays readable and writable even if the store evicted the slot; it just
	// no longer keeps anything alive (see IsDetached()).
	template <typename T>
	class StateHandle {
	public:
		explicit StateHandle(std::shared_ptr<Slot<T>> slot) : slot(std::move(slot)) {}

		// Reads the value through a projection and returns its result.
		template <typename F>
		decltype(auto) Get(F&& reader) const {
			slot->Touch();
			return std::forward<F>(reader)(std::as_const(slot->Value()));
		}

		// Copy of the current value.
		T Value() const {
			slot->Touch();
			return slot->Value();
		}

		// Replaces the value outright.
		void Set(T value) {
			slot->Touch();
			slot->Value() = std::move(value);
		}

		// In-place update. Returns whatever the mutator returns.
		template <typename F>
		decltype(auto) Mutate(F&& mutator) {
			slot->Touch();
			return std::forward<F>(mutator)(slot->Value());
		}

		bool IsDetached() const { return slot->IsDetached(); }

		// Two handles are equal when they share the same slot.
		bool operator==(const StateHandle& other) const { return slot == other.slot; }
		bool operator!=(const StateHandle& other) const { return slot != other.slot; }

	private:
		std::shared_ptr<Slot<T>> slot;
	};

}
