#include "Rooted.h"

#include <iostream>
#include <string>
#include <vector>

// Small simulated widget tree. Each widget keeps private state across frames
// without the caller threading it through.

struct Theme {
    std::string accent = "blue";
};

static void Counter(const std::string& label, Rooted::ContextHandle<Theme>& theme) {
    auto clicks = Rooted::UseState([] { return 0; });
    clicks.Mutate([](int& value) { ++value; });

    std::string accent = theme.Get([](const Theme& t) { return t.accent; });
    ROOTED_PRINT(RootedLogging::LogLevel::Info, "  ", label, " clicked ", clicks.Value(), " times (", accent, ")");
}

static void ItemList(const std::vector<std::string>& items, Rooted::ContextHandle<Theme>& theme) {
    for (const std::string& item : items) {
        Rooted::CallInSlot(item, [&] {
            Counter(item, theme);
        });
    }
}

int main(int argc, char** argv) {
    Rooted::StoreSettingsManager settings;
    if (argc > 1 && !settings.LoadFromFile(argv[1])) {
        std::cerr << "Could not load settings from " << argv[1] << ", using defaults" << std::endl;
    }

    if (!RootedLogging::Initialize(settings.Get().logFilePath)) {
        std::cerr << "Logging unavailable, continuing without it" << std::endl;
    }
    settings.ApplyLogLevel();
    Rooted::SlotStore::GetInstance().Configure(settings.Get());

    ROOTED_PRINT("=== ROOTED DEMO ===");

    auto theme = Rooted::CreateContext(Theme{});
    std::vector<std::string> items = { "apples", "pears", "plums" };

    for (int frame = 0; frame < 6; ++frame) {
        ROOTED_PRINT(RootedLogging::LogLevel::Info, "Frame ", frame);

        // From frame 3 on the list shrinks, so "plums" loses its state.
        if (frame == 3) {
            items.pop_back();
        }

        Rooted::RunFrame([&] {
            Counter("header", theme);

            Rooted::Nested([&] {
                theme.Provide(Theme{ "red" }, [&] {
                    ItemList(items, theme);
                });
            });
        });

        Rooted::SweepStats stats = Rooted::SlotStore::GetInstance().GetLastSweepStats();
        ROOTED_PRINT(RootedLogging::LogLevel::Info, "  live slots: ", Rooted::SlotStore::GetInstance().LiveSlotCount(),
            ", evicted this frame: ", stats.evictedSlots);
    }

    ROOTED_PRINT("=== Demo ended ===");
    RootedLogging::Shutdown();
    return 0;
}
