#include "pch.h"
#include "Store/SlotStore.hpp"
#include "Logging.hpp"

namespace Rooted {

	SlotStore::SlotStore() {
		slots.reserve(StoreSettings{}.reserveSlots);
	}

	SlotStore::~SlotStore() {
		// No logging here: the process-wide store may outlive the logger.
		for (auto& pair : slots) {
			pair.second->Detach();
		}
		for (auto& pair : contexts) {
			pair.second->Detach();
		}
	}

	SlotStore& SlotStore::GetInstance() {
		static SlotStore instance;
		return instance;
	}

	void SlotStore::Configure(const StoreSettings& settings) {
		std::unique_lock<std::shared_mutex> lock(mutex);
		slots.reserve(settings.reserveSlots);
		slotWarningThreshold = settings.slotWarningThreshold;
		logSweeps = settings.logSweeps;
		warnedOverThreshold = false;
	}

	std::shared_ptr<ISlot> SlotStore::FindAndTouch(const SlotKey& key) {
		std::shared_lock<std::shared_mutex> lock(mutex);
		auto it = slots.find(key);
		if (it == slots.end()) {
			return nullptr;
		}
		it->second->Touch();
		return it->second;
	}

	std::shared_ptr<ISlot> SlotStore::FindContextAndTouch(TypeTag type) {
		std::shared_lock<std::shared_mutex> lock(mutex);
		auto it = contexts.find(type);
		if (it == contexts.end()) {
			return nullptr;
		}
		it->second->Touch();
		return it->second;
	}

	std::shared_ptr<ISlot> SlotStore::InsertOrGet(const SlotKey& key, std::shared_ptr<ISlot> slot) {
		assert(slot && slot->GetTypeTag() == key.type && "Inserted slot must match its key type");

		std::unique_lock<std::shared_mutex> lock(mutex);
		auto [it, inserted] = slots.try_emplace(key, std::move(slot));
		if (!inserted) {
			it->second->Touch();
			return it->second;
		}

		if (slotWarningThreshold > 0 && !warnedOverThreshold && slots.size() > slotWarningThreshold) {
			warnedOverThreshold = true;
			ROOTED_PRINT(RootedLogging::LogLevel::Warn, "[SlotStore] ", slots.size(),
				" live slots exceed the warning threshold of ", slotWarningThreshold,
				"; check that the host sweeps once per cycle");
		}
		return it->second;
	}

	std::shared_ptr<ISlot> SlotStore::InsertContextOrGet(TypeTag type, std::shared_ptr<ISlot> slot) {
		assert(slot && slot->GetTypeTag() == type && "Inserted context must match its key type");

		std::unique_lock<std::shared_mutex> lock(mutex);
		auto [it, inserted] = contexts.try_emplace(type, std::move(slot));
		if (!inserted) {
			it->second->Touch();
			return it->second;
		}

		ROOTED_PRINT(RootedLogging::LogLevel::Debug, "[SlotStore] Created context for ", TypeTags::NameOf(type));
		return it->second;
	}

	bool SlotStore::ContainsKey(const SlotKey& key) const {
		std::shared_lock<std::shared_mutex> lock(mutex);
		return slots.find(key) != slots.end();
	}

	bool SlotStore::ContainsContext(TypeTag type) const {
		std::shared_lock<std::shared_mutex> lock(mutex);
		return contexts.find(type) != contexts.end();
	}

	template <typename Map>
	std::pair<size_t, size_t> SlotStore::SweepRegistry(Map& registry) {
		size_t evicted = 0;
		size_t survived = 0;

		for (auto it = registry.begin(); it != registry.end();) {
			ISlot& slot = *it->second;
			if (slot.ResetTouched()) {
				++survived;
				++it;
				continue;
			}

			// Detach before erasing so handles holding the last reference see it.
			slot.Detach();
			it = registry.erase(it);
			++evicted;
		}
		return { evicted, survived };
	}

	void SlotStore::Sweep() {
		std::unique_lock<std::shared_mutex> lock(mutex);

		auto [evictedSlots, survivedSlots] = SweepRegistry(slots);
		auto [evictedContexts, survivedContexts] = SweepRegistry(contexts);

		lastSweep = SweepStats{ evictedSlots, survivedSlots, evictedContexts, survivedContexts };

		if (slotWarningThreshold == 0 || slots.size() <= slotWarningThreshold) {
			warnedOverThreshold = false;
		}

		if (logSweeps) {
			ROOTED_PRINT(RootedLogging::LogLevel::Debug, "[SlotStore] Sweep evicted ", evictedSlots, " slots and ",
				evictedContexts, " contexts; ", survivedSlots, " slots and ", survivedContexts, " contexts survive");
		}
	}

	void SlotStore::Clear() {
		std::unique_lock<std::shared_mutex> lock(mutex);

		for (auto& pair : slots) {
			pair.second->Detach();
		}
		for (auto& pair : contexts) {
			pair.second->Detach();
		}

		size_t dropped = slots.size() + contexts.size();
		slots.clear();
		contexts.clear();
		warnedOverThreshold = false;

		if (dropped > 0) {
			ROOTED_PRINT(RootedLogging::LogLevel::Debug, "[SlotStore] Cleared ", dropped, " slots");
		}
	}

	size_t SlotStore::LiveSlotCount() const {
		std::shared_lock<std::shared_mutex> lock(mutex);
		return slots.size();
	}

	size_t SlotStore::LiveContextCount() const {
		std::shared_lock<std::shared_mutex> lock(mutex);
		return contexts.size();
	}

	SweepStats SlotStore::GetLastSweepStats() const {
		std::shared_lock<std::shared_mutex> lock(mutex);
		return lastSweep;
	}

}
