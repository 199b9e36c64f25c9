#pragma once

#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

#include "Identity/PositionId.hpp"
#include "Store/TypeTag.hpp"

namespace Rooted {

	// At most one live slot exists per key.
	struct SlotKey {
		PositionId position;
		TypeTag type = 0;

		bool operator==(const SlotKey& other) const {
			return position == other.position && type == other.type;
		}
		bool operator!=(const SlotKey& other) const { return !(*this == other); }
	};

	// Type-erased storage unit owned by the SlotStore. Handles share ownership
	// of the concrete slot, so eviction only drops the store's reference.
	class ISlot {
	public:
		explicit ISlot(TypeTag type) : type(type) {}
		virtual ~ISlot() = default;

		ISlot(const ISlot&) = delete;
		ISlot& operator=(const ISlot&) = delete;

		TypeTag GetTypeTag() const { return type; }

		// Marks the slot accessed in the current sweep window.
		void Touch() { touched.store(true, std::memory_order_relaxed); }
		bool IsTouched() const { return touched.load(std::memory_order_relaxed); }

		// True once the store evicted the slot.
		bool IsDetached() const { return detached.load(std::memory_order_acquire); }

	private:
		friend class SlotStore;

		// Returns the previous touched state and starts a new window.
		bool ResetTouched() { return touched.exchange(false, std::memory_order_relaxed); }
		void Detach() { detached.store(true, std::memory_order_release); }

		const TypeTag type;
		std::atomic<bool> touched{ true }; // Created slots count as touched for their first window.
		std::atomic<bool> detached{ false };
	};

	template <typename T>
	class Slot : public ISlot {
	public:
		Slot(TypeTag type, T initial) : ISlot(type), value(std::move(initial)) {}

		T& Value() { return value; }
		const T& Value() const { return value; }

	private:
		T value;
	};

	// Type-keyed slot with a stack of scoped overrides above the base value.
	// Only the base value belongs to the sweep window; overrides live exactly
	// as long as the scope that pushed them.
	template <typename T>
	class ContextSlot : public ISlot {
	public:
		ContextSlot(TypeTag type, T initial) : ISlot(type), base(std::move(initial)) {}

		template <typename F>
		decltype(auto) Read(F&& reader) {
			std::lock_guard<std::mutex> lock(mutex);
			const T& current = overrides.empty() ? base : overrides.back();
			return std::forward<F>(reader)(current);
		}

		// Writes the current value: the innermost override if any, else the base.
		void Write(T value) {
			std::lock_guard<std::mutex> lock(mutex);
			if (overrides.empty()) {
				base = std::move(value);
			}
			else {
				overrides.back() = std::move(value);
			}
		}

		size_t PushOverride(T value) {
			std::lock_guard<std::mutex> lock(mutex);
			overrides.push_back(std::move(value));
			return overrides.size();
		}

		// Returns false when the stack does not have the expected depth.
		bool PopOverride(size_t expectedDepth) {
			std::lock_guard<std::mutex> lock(mutex);
			if (overrides.size() != expectedDepth) {
				return false;
			}
			overrides.pop_back();
			return true;
		}

		size_t OverrideDepth() const {
			std::lock_guard<std::mutex> lock(mutex);
			return overrides.size();
		}

	private:
		mutable std::mutex mutex;
		T base;
		std::vector<T> overrides;
	};

}

template <>
struct std::hash<Rooted::SlotKey> {
	size_t operator()(const Rooted::SlotKey& key) const noexcept {
		return static_cast<size_t>(Rooted::HashCombine(key.position.Value(), key.type));
	}
};
