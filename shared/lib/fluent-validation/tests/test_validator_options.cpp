/**
 * @file test_validator_options.cpp
 * @brief Unit tests for ValidatorOptions, LanguageManager and configuration loading
 */

#include <gtest/gtest.h>
#include <fluentval/validation.h>
#include "config/config_manager.h"
#include "logging/logger.h"
#include "test_helpers.h"

using namespace fluentval::validation;
using namespace test_helpers;
using fluentval::common::ConfigException;
using fluentval::common::ConfigManager;
using fluentval::common::Logger;

class ValidatorOptionsTest : public ValidatorTestBase {
protected:
    void TearDown() override {
        auto& config = ConfigManager::getInstance();
        config.remove(ConfigManager::CASCADE_MODE);
        config.remove(ConfigManager::DEFAULT_SEVERITY);
        config.remove(ConfigManager::LOG_LEVEL);
        Logger::setLevel("info");
        ValidatorTestBase::TearDown();
    }
};

// ============================================================================
// Enum parsing
// ============================================================================

TEST_F(ValidatorOptionsTest, SeverityFromString_CaseInsensitive) {
    EXPECT_EQ(severityFromString("warning"), Severity::WARNING);
    EXPECT_EQ(severityFromString(" INFO "), Severity::INFO);
    EXPECT_EQ(severityFromString("Error"), Severity::ERROR);
    EXPECT_FALSE(severityFromString("fatal").has_value());
}

TEST_F(ValidatorOptionsTest, CascadeModeFromString_CaseInsensitive) {
    EXPECT_EQ(cascadeModeFromString("STOP"), CascadeMode::STOP);
    EXPECT_EQ(cascadeModeFromString("continue"), CascadeMode::CONTINUE);
    EXPECT_FALSE(cascadeModeFromString("halt").has_value());
}

TEST_F(ValidatorOptionsTest, EnumToString) {
    EXPECT_EQ(severityToString(Severity::WARNING), "Warning");
    EXPECT_EQ(cascadeModeToString(CascadeMode::STOP), "Stop");
    EXPECT_EQ(comparisonToString(Comparison::GREATER_THAN_OR_EQUAL), "GreaterThanOrEqual");
}

// ============================================================================
// Defaults and reset
// ============================================================================

TEST_F(ValidatorOptionsTest, Defaults) {
    auto& options = ValidatorOptions::global();
    EXPECT_EQ(options.defaultCascadeMode(), CascadeMode::CONTINUE);
    EXPECT_EQ(options.defaultSeverity(), Severity::ERROR);
    EXPECT_FALSE(options.displayNameResolver());
}

TEST_F(ValidatorOptionsTest, Reset_RestoresDefaults) {
    auto& options = ValidatorOptions::global();
    options.setDefaultCascadeMode(CascadeMode::STOP);
    options.setDefaultSeverity(Severity::INFO);
    options.setDisplayNameResolver([](const std::type_index&, const MemberInfo&) { return std::string("x"); });
    options.languageManager().addTemplate("EqualValidator", "changed");

    options.reset();

    EXPECT_EQ(options.defaultCascadeMode(), CascadeMode::CONTINUE);
    EXPECT_EQ(options.defaultSeverity(), Severity::ERROR);
    EXPECT_FALSE(options.displayNameResolver());
    EXPECT_EQ(options.languageManager().getString("EqualValidator"),
              "'{PropertyName}' must be equal to '{ComparisonValue}'.");
}

TEST_F(ValidatorOptionsTest, ResolveDisplayName_Default) {
    auto& options = ValidatorOptions::global();
    EXPECT_EQ(options.resolveDisplayName(typeid(Person), memberOf<Person>("Forename")), "Forename");
    EXPECT_EQ(options.resolveDisplayName(typeid(Person), memberOf<Person>("NullableInt")), "Nullable Int");
}

// ============================================================================
// Message templates
// ============================================================================

TEST_F(ValidatorOptionsTest, LanguageManager_HasBuiltInTemplates) {
    auto& languages = ValidatorOptions::global().languageManager();
    for (const char* name : {"EqualValidator", "NotEqualValidator", "LessThanValidator",
                             "LessThanOrEqualValidator", "GreaterThanValidator",
                             "GreaterThanOrEqualValidator", "InclusiveBetweenValidator",
                             "ExclusiveBetweenValidator"}) {
        EXPECT_TRUE(languages.has(name)) << name;
    }
    EXPECT_EQ(languages.getString("InclusiveBetweenValidator"),
              "'{PropertyName}' must be between {From} and {To}. You entered {PropertyValue}.");
}

TEST_F(ValidatorOptionsTest, LanguageManager_UnknownKeyIsEmpty) {
    auto& languages = ValidatorOptions::global().languageManager();
    EXPECT_FALSE(languages.has("NoSuchValidator"));
    EXPECT_EQ(languages.getString("NoSuchValidator"), "");
}

TEST_F(ValidatorOptionsTest, LanguageManager_OverrideUsedByValidators) {
    ValidatorOptions::global().languageManager().addTemplate(
        "GreaterThanValidator", "{PropertyName} needs more than {ComparisonValue}");

    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Id", &Person::id).greaterThan(3);
    });
    auto result = validator.validate(personWithId(1));
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].errorMessage, "Id needs more than 3");
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(ValidatorOptionsTest, LoadFromConfig_AppliesValues) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::CASCADE_MODE, "Stop");
    config.set(ConfigManager::DEFAULT_SEVERITY, "warning");

    ValidatorOptions::global().loadFromConfig(config);

    EXPECT_EQ(ValidatorOptions::global().defaultCascadeMode(), CascadeMode::STOP);
    EXPECT_EQ(ValidatorOptions::global().defaultSeverity(), Severity::WARNING);
}

TEST_F(ValidatorOptionsTest, LoadFromConfig_SetsLogLevel) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::LOG_LEVEL, "debug");

    ValidatorOptions::global().loadFromConfig(config);

    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}

TEST_F(ValidatorOptionsTest, LoadFromConfig_IgnoresInvalidValues) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::CASCADE_MODE, "sometimes");
    config.set(ConfigManager::DEFAULT_SEVERITY, "Info");

    EXPECT_NO_THROW(ValidatorOptions::global().loadFromConfig(config));

    EXPECT_EQ(ValidatorOptions::global().defaultCascadeMode(), CascadeMode::CONTINUE);
    EXPECT_EQ(ValidatorOptions::global().defaultSeverity(), Severity::INFO);
}

TEST_F(ValidatorOptionsTest, LoadFromConfig_StrictRejectsInvalidValues) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::DEFAULT_SEVERITY, "fatal");
    EXPECT_THROW(ValidatorOptions::global().loadFromConfig(config, true), ConfigException);

    config.remove(ConfigManager::DEFAULT_SEVERITY);
    config.set(ConfigManager::LOG_LEVEL, "verbose");
    EXPECT_THROW(ValidatorOptions::global().loadFromConfig(config, true), ConfigException);
}

TEST_F(ValidatorOptionsTest, LoadFromConfig_AffectsExistingValidators) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Id", &Person::id).greaterThan(0).greaterThan(5);
    });

    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::CASCADE_MODE, "stop");
    config.set(ConfigManager::DEFAULT_SEVERITY, "info");
    ValidatorOptions::global().loadFromConfig(config);

    auto result = validator.validate(personWithId(0));
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].severity, Severity::INFO);
}
