#pragma once

#include <memory>
#include <shared_mutex>
#include <source_location>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "RootedAPI.h"
#include "Invariant.hpp"
#include "Identity/CallTree.hpp"
#include "Store/Slot.hpp"
#include "Store/TypeTag.hpp"
#include "Handles/StateHandle.hpp"
#include "Settings/StoreSettings.hpp"

namespace Rooted {

	template <typename T>
	class ContextHandle;

	// Value type produced by an initializer.
	template <typename F>
	using RootedType = std::decay_t<std::invoke_result_t<F&>>;

	struct SweepStats {
		size_t evictedSlots = 0;
		size_t survivedSlots = 0;
		size_t evictedContexts = 0;
		size_t survivedContexts = 0;
	};

	// SlotStore - identity-keyed registry of rooted state.
	//
	// Position-keyed slots are keyed by (PositionId, TypeTag), contexts by
	// TypeTag alone. Rooting is idempotent: the initializer runs only when no
	// live slot exists for the key. Sweep() evicts every slot that was not
	// touched since the previous sweep and starts a new window for the rest.
	//
	// Threading: rooting from several threads is safe as long as each thread
	// uses disjoint keys. Sweep() must run between traversal cycles, never
	// while a traversal is still rooting for the same cycle.
	class ROOTED_API SlotStore {
	public:
		SlotStore();
		~SlotStore();

		SlotStore(const SlotStore&) = delete;
		SlotStore& operator=(const SlotStore&) = delete;

		// Process-wide store, created on first access and alive until exit.
		// One thread at a time may sweep it.
		static SlotStore& GetInstance();

		void Configure(const StoreSettings& settings);

		// Roots state at the caller's position on the calling thread's CallTree.
		template <typename F>
		StateHandle<RootedType<F>> Root(F&& initializer, const std::source_location& location = std::source_location::current());

		// Roots state at an explicit position.
		template <typename F>
		StateHandle<RootedType<F>> RootAt(PositionId position, F&& initializer);

		// Establishes the context value for T unless one is alive already.
		template <typename T>
		ContextHandle<T> CreateContext(T initial);

		// Evicts untouched slots and resets the touched flag of survivors.
		void Sweep();

		// Drops all state.
		void Clear();

		size_t LiveSlotCount() const;
		size_t LiveContextCount() const;

		template <typename T>
		bool Contains(PositionId position) const {
			return ContainsKey(SlotKey{ position, TypeTags::Of<T>() });
		}

		template <typename T>
		bool HasContext() const {
			return ContainsContext(TypeTags::Of<T>());
		}

		SweepStats GetLastSweepStats() const;

	private:
		template <typename T>
		friend class ContextHandle;

		// Lets tests plant a slot under a mismatched key.
		friend class SlotStoreTestAccess;

		template <typename T>
		std::shared_ptr<ContextSlot<T>> RootContext(T initial);

		// Both lookups mark the found slot touched.
		std::shared_ptr<ISlot> FindAndTouch(const SlotKey& key);
		std::shared_ptr<ISlot> FindContextAndTouch(TypeTag type);

		// Returns the slot now registered under the key, which is the existing
		// one if another caller won the race.
		std::shared_ptr<ISlot> InsertOrGet(const SlotKey& key, std::shared_ptr<ISlot> slot);
		std::shared_ptr<ISlot> InsertContextOrGet(TypeTag type, std::shared_ptr<ISlot> slot);

		// Evict-then-reset pass over one registry. Returns {evicted, survived}.
		template <typename Map>
		static std::pair<size_t, size_t> SweepRegistry(Map& registry);

		bool ContainsKey(const SlotKey& key) const;
		bool ContainsContext(TypeTag type) const;

		template <typename SlotType>
		static std::shared_ptr<SlotType> Downcast(std::shared_ptr<ISlot> slot, TypeTag expected) {
			if (!slot || slot->GetTypeTag() != expected) {
				FatalInvariant("slot registered under type " + TypeTags::NameOf(expected) +
					" holds " + (slot ? TypeTags::NameOf(slot->GetTypeTag()) : std::string("nothing")));
			}
			return std::static_pointer_cast<SlotType>(std::move(slot));
		}

		mutable std::shared_mutex mutex;
		std::unordered_map<SlotKey, std::shared_ptr<ISlot>> slots{};          // Position-keyed slots.
		std::unordered_map<TypeTag, std::shared_ptr<ISlot>> contexts{};       // Type-keyed context slots.
		SweepStats lastSweep{};
		size_t slotWarningThreshold = StoreSettings{}.slotWarningThreshold;
		bool logSweeps = false;
		bool warnedOverThreshold = false;
	};

	template <typename F>
	StateHandle<RootedType<F>> SlotStore::Root(F&& initializer, const std::source_location& location) {
		CallTree& tree = CallTree::Current();
		return tree.EnterScope(CallSite::From(location), [&]() {
			return RootAt(tree.CurrentPosition(), std::forward<F>(initializer));
		});
	}

	template <typename F>
	StateHandle<RootedType<F>> SlotStore::RootAt(PositionId position, F&& initializer) {
		using T = RootedType<F>;
		const TypeTag tag = TypeTags::Of<T>();
		const SlotKey key{ position, tag };

		if (std::shared_ptr<ISlot> existing = FindAndTouch(key)) {
			return StateHandle<T>(Downcast<Slot<T>>(std::move(existing), tag));
		}

		// The initializer runs outside the lock so it may root state itself.
		std::shared_ptr<ISlot> created = std::make_shared<Slot<T>>(tag, std::forward<F>(initializer)());
		return StateHandle<T>(Downcast<Slot<T>>(InsertOrGet(key, std::move(created)), tag));
	}

	template <typename T>
	std::shared_ptr<ContextSlot<T>> SlotStore::RootContext(T initial) {
		const TypeTag tag = TypeTags::Of<T>();

		if (std::shared_ptr<ISlot> existing = FindContextAndTouch(tag)) {
			return Downcast<ContextSlot<T>>(std::move(existing), tag);
		}

		std::shared_ptr<ISlot> created = std::make_shared<ContextSlot<T>>(tag, std::move(initial));
		return Downcast<ContextSlot<T>>(InsertContextOrGet(tag, std::move(created)), tag);
	}

}

#include "Handles/ContextHandle.hpp"
