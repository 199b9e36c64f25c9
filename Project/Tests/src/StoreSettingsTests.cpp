#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "Logging.hpp"
#include "Settings/StoreSettings.hpp"

using Rooted::StoreSettings;
using Rooted::StoreSettingsManager;

TEST(StoreSettingsTest, DefaultsBeforeLoading) {
	StoreSettingsManager manager;
	StoreSettings settings = manager.Get();

	EXPECT_EQ(settings.logLevel, "info");
	EXPECT_TRUE(settings.logFilePath.empty());
	EXPECT_EQ(settings.reserveSlots, 256u);
	EXPECT_EQ(settings.slotWarningThreshold, 65536u);
	EXPECT_FALSE(settings.logSweeps);
}

TEST(StoreSettingsTest, LoadsKnownFields) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({
		"logLevel": "debug",
		"logFilePath": "logs/rooted.log",
		"reserveSlots": 1024,
		"slotWarningThreshold": 5000,
		"logSweeps": true
	})"));

	StoreSettings settings = manager.Get();
	EXPECT_EQ(settings.logLevel, "debug");
	EXPECT_EQ(settings.logFilePath, "logs/rooted.log");
	EXPECT_EQ(settings.reserveSlots, 1024u);
	EXPECT_EQ(settings.slotWarningThreshold, 5000u);
	EXPECT_TRUE(settings.logSweeps);
}

TEST(StoreSettingsTest, ClampsOutOfRangeNumbers) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "reserveSlots": -20, "slotWarningThreshold": 1e12 })"));

	StoreSettings settings = manager.Get();
	EXPECT_EQ(settings.reserveSlots, 0u);
	EXPECT_EQ(settings.slotWarningThreshold, 4294967295u);

	ASSERT_TRUE(manager.LoadFromString(R"({ "reserveSlots": 1e9 })"));
	EXPECT_EQ(manager.Get().reserveSlots, StoreSettingsManager::MAX_RESERVE_SLOTS);
}

TEST(StoreSettingsTest, UnknownLogLevelFallsBackToInfo) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "logLevel": "verbose" })"));
	EXPECT_EQ(manager.Get().logLevel, "info");
}

TEST(StoreSettingsTest, MalformedJsonKeepsCurrentSettings) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "logSweeps": true })"));

	EXPECT_FALSE(manager.LoadFromString("{ \"logSweeps\": false"));
	EXPECT_FALSE(manager.LoadFromString("[1, 2, 3]"));
	EXPECT_TRUE(manager.Get().logSweeps);
}

TEST(StoreSettingsTest, WrongTypesAreIgnored) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "reserveSlots": "many", "logSweeps": 1 })"));

	StoreSettings settings = manager.Get();
	EXPECT_EQ(settings.reserveSlots, 256u);
	EXPECT_FALSE(settings.logSweeps);
}

TEST(StoreSettingsTest, SavedFileLoadsBack) {
	namespace fs = std::filesystem;
	fs::path path = fs::temp_directory_path() / "rooted_settings_test" / "settings.json";

	StoreSettingsManager writer;
	StoreSettings custom;
	custom.logLevel = "warn";
	custom.reserveSlots = 64;
	custom.logSweeps = true;
	writer.Set(custom);
	ASSERT_TRUE(writer.SaveToFile(path.string()));

	StoreSettingsManager reader;
	ASSERT_TRUE(reader.LoadFromFile(path.string()));
	EXPECT_EQ(reader.Get().logLevel, "warn");
	EXPECT_EQ(reader.Get().reserveSlots, 64u);
	EXPECT_TRUE(reader.Get().logSweeps);

	std::error_code ec;
	fs::remove_all(path.parent_path(), ec);
}

TEST(StoreSettingsTest, MissingFileReportsFailure) {
	StoreSettingsManager manager;
	EXPECT_FALSE(manager.LoadFromFile("does/not/exist/settings.json"));
	EXPECT_EQ(manager.Get().logLevel, "info");
}

TEST(StoreSettingsTest, ResetRestoresDefaults) {
	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "reserveSlots": 8 })"));
	manager.ResetToDefaults();
	EXPECT_EQ(manager.Get().reserveSlots, 256u);
}

TEST(StoreSettingsTest, ApplyLogLevelSetsLoggingLevel) {
	RootedLogging::LogLevel previous = RootedLogging::GetLevel();

	StoreSettingsManager manager;
	ASSERT_TRUE(manager.LoadFromString(R"({ "logLevel": "error" })"));
	manager.ApplyLogLevel();
	EXPECT_EQ(RootedLogging::GetLevel(), RootedLogging::LogLevel::Error);

	RootedLogging::SetLevel(previous);
}
