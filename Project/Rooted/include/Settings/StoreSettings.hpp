#pragma once

#include <cstddef>
#include <mutex>
#include <string>

#include "RootedAPI.h"

namespace Rooted {

	// StoreSettings - tunables for a SlotStore and the logging system
	struct StoreSettings {
		std::string logLevel = "info";       // trace, debug, info, warn, error, critical
		std::string logFilePath;             // Empty disables the file sink
		size_t reserveSlots = 256;           // Buckets reserved up front for position-keyed slots
		size_t slotWarningThreshold = 65536; // Warn once when live slots grow past this (0 disables)
		bool logSweeps = false;              // Debug-log a summary after every sweep
	};

	// StoreSettingsManager - loads and saves StoreSettings as JSON
	//
	// Out-of-range numbers are clamped and unknown log levels fall back to
	// "info"; a malformed document leaves the current settings untouched.
	class ROOTED_API StoreSettingsManager {
	public:
		StoreSettingsManager();

		// Load settings from a JSON file. Returns false if the file is missing or unreadable.
		bool LoadFromFile(const std::string& filePath);

		// Load settings from a JSON string. Returns false on parse errors.
		bool LoadFromString(const std::string& json);

		// Save settings to a JSON file, creating parent directories.
		bool SaveToFile(const std::string& filePath) const;

		std::string ToJson() const;

		void ResetToDefaults();

		// Apply the log level to RootedLogging.
		void ApplyLogLevel() const;

		StoreSettings Get() const;
		void Set(const StoreSettings& settings);

		static constexpr size_t MAX_RESERVE_SLOTS = 1u << 20;

	private:
		mutable std::mutex m_mutex;
		StoreSettings m_settings;
	};

}
