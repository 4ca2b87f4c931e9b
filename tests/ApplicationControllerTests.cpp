#include <gtest/gtest.h>

#include "application/controllers/ApplicationController.hpp"
#include "core/types/Error.hpp"
#include <cstdlib>

class ApplicationControllerTest : public ::testing::Test {
protected:
    static constexpr const char *MISSING_CONFIG = "/nonexistent/printer_link/config.json";
    static constexpr const char *MISSING_ENV = "/nonexistent/printer_link/.env";

    void SetUp() override {
        clearEnvironment();
        setenv("LOG_TO_FILE", "false", 1);
    }

    void TearDown() override {
        clearEnvironment();
    }

    static void clearEnvironment() {
        for (const char *name: {"DISCOVERY_TIMEOUT_S", "SCANNER_MAX_CONCURRENT", "LOG_TO_FILE"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ApplicationControllerTest, DiscoverTimeout_DefaultsToConfiguredValue) {
    ApplicationController app;
    app.initialize(MISSING_CONFIG, MISSING_ENV);
    EXPECT_EQ(app.discoveryTimeoutSeconds(), 5);
}

TEST_F(ApplicationControllerTest, DiscoverTimeout_FollowsEnvironment) {
    setenv("DISCOVERY_TIMEOUT_S", "9", 1);

    ApplicationController app;
    app.initialize(MISSING_CONFIG, MISSING_ENV);
    EXPECT_EQ(app.discoveryTimeoutSeconds(), 9);
}

TEST_F(ApplicationControllerTest, InvalidTunables_FailAsConfigurationError) {
    setenv("SCANNER_MAX_CONCURRENT", "64", 1);

    ApplicationController app;
    try {
        app.initialize(MISSING_CONFIG, MISSING_ENV);
        FAIL() << "expected ConfigurationException";
    } catch (const core::types::ConfigurationException &e) {
        EXPECT_EQ(e.kind(), core::types::ErrorKind::Configuration);
    }
}
