// tests/testing_env.cpp

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "abilities/ability_registry.h"
#include "cardsets/card_registry.h"

// Shared setup for every test binary: one debug console logger and the standard catalogs.
class SkirmishTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        if (!spdlog::get("console")) {
            auto console = spdlog::stdout_color_mt("console");
            console->set_level(spdlog::level::debug);
            spdlog::set_default_logger(console);
            spdlog::set_level(spdlog::level::debug);
            spdlog::flush_on(spdlog::level::warn);
        }
        // Registries are process-wide and reject duplicate names
        registerAllCards();
        registerAllAbilities();
    }

    void TearDown() override {
        spdlog::shutdown();
    }
};

::testing::Environment* const skirmish_env =
    ::testing::AddGlobalTestEnvironment(new SkirmishTestEnvironment());
