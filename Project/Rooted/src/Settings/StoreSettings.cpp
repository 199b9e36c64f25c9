#include "pch.h"
#include "Settings/StoreSettings.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

namespace Rooted {

    StoreSettingsManager::StoreSettingsManager() = default;

    bool StoreSettingsManager::LoadFromFile(const std::string& filePath) {
        namespace fs = std::filesystem;

        // Check if file exists (avoid exception overhead)
        std::error_code ec;
        if (!fs::exists(filePath, ec)) {
            ROOTED_PRINT(RootedLogging::LogLevel::Info, "[StoreSettings] No settings file at ", filePath, ", using current settings");
            return false;
        }

        std::ifstream inFile(filePath, std::ios::binary);
        if (!inFile.is_open()) {
            ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] Failed to open file: ", filePath);
            return false;
        }

        // Read entire file into string
        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        inFile.close();

        if (!LoadFromString(jsonContent)) {
            ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] Could not load settings from: ", filePath);
            return false;
        }

        ROOTED_PRINT(RootedLogging::LogLevel::Info, "[StoreSettings] Loaded settings from ", filePath);
        return true;
    }

    bool StoreSettingsManager::LoadFromString(const std::string& json) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError() || !doc.IsObject()) {
            ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] JSON parse error at offset ", doc.GetErrorOffset());
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        StoreSettings loaded = m_settings;

        if (doc.HasMember("logLevel") && doc["logLevel"].IsString()) {
            std::string name = doc["logLevel"].GetString();
            RootedLogging::LogLevel parsed;
            if (RootedLogging::ParseLevel(name, parsed)) {
                loaded.logLevel = name;
            }
            else {
                ROOTED_PRINT(RootedLogging::LogLevel::Warn, "[StoreSettings] Unknown log level '", name, "', using info");
                loaded.logLevel = "info";
            }
        }
        if (doc.HasMember("logFilePath") && doc["logFilePath"].IsString()) {
            loaded.logFilePath = doc["logFilePath"].GetString();
        }

        // Load and clamp store tunables
        if (doc.HasMember("reserveSlots") && doc["reserveSlots"].IsNumber()) {
            double value = doc["reserveSlots"].GetDouble();
            loaded.reserveSlots = static_cast<size_t>(std::clamp(value, 0.0, static_cast<double>(MAX_RESERVE_SLOTS)));
        }
        if (doc.HasMember("slotWarningThreshold") && doc["slotWarningThreshold"].IsNumber()) {
            double value = doc["slotWarningThreshold"].GetDouble();
            loaded.slotWarningThreshold = static_cast<size_t>(std::clamp(value, 0.0, 4294967295.0));
        }
        if (doc.HasMember("logSweeps") && doc["logSweeps"].IsBool()) {
            loaded.logSweeps = doc["logSweeps"].GetBool();
        }

        m_settings = loaded;
        return true;
    }

    std::string StoreSettingsManager::ToJson() const {
        std::lock_guard<std::mutex> lock(m_mutex);

        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        rapidjson::Value logLevel(m_settings.logLevel.c_str(), allocator);
        rapidjson::Value logFilePath(m_settings.logFilePath.c_str(), allocator);
        doc.AddMember("logLevel", logLevel, allocator);
        doc.AddMember("logFilePath", logFilePath, allocator);
        doc.AddMember("reserveSlots", static_cast<uint64_t>(m_settings.reserveSlots), allocator);
        doc.AddMember("slotWarningThreshold", static_cast<uint64_t>(m_settings.slotWarningThreshold), allocator);
        doc.AddMember("logSweeps", m_settings.logSweeps, allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return std::string(buffer.GetString(), buffer.GetSize());
    }

    bool StoreSettingsManager::SaveToFile(const std::string& filePath) const {
        namespace fs = std::filesystem;

        std::error_code ec;
        fs::path parent = fs::path(filePath).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] Failed to create directory ", parent.string(), ": ", ec.message());
                return false;
            }
        }

        std::ofstream outFile(filePath, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] Failed to open file for writing: ", filePath);
            return false;
        }

        outFile << ToJson();
        outFile.close();

        if (!outFile) {
            ROOTED_PRINT(RootedLogging::LogLevel::Error, "[StoreSettings] Failed to write file: ", filePath);
            return false;
        }

        ROOTED_PRINT(RootedLogging::LogLevel::Debug, "[StoreSettings] Saved settings to ", filePath);
        return true;
    }

    void StoreSettingsManager::ResetToDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = StoreSettings{};
    }

    void StoreSettingsManager::ApplyLogLevel() const {
        RootedLogging::LogLevel level = RootedLogging::LogLevel::Info;
        if (!RootedLogging::ParseLevel(Get().logLevel, level)) {
            level = RootedLogging::LogLevel::Info;
        }
        RootedLogging::SetLevel(level);
    }

    StoreSettings StoreSettingsManager::Get() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_settings;
    }

    void StoreSettingsManager::Set(const StoreSettings& settings) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = settings;
    }

}
