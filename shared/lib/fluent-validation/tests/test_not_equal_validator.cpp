/**
 * @file test_not_equal_validator.cpp
 * @brief Unit tests for NotEqualValidator
 */

#include <gtest/gtest.h>
#include <fluentval/validation.h>
#include "test_helpers.h"

using namespace fluentval::validation;
using namespace test_helpers;

namespace {

/// Value type with equality but no stream operator
struct MyValueType {
    std::optional<int> value;

    bool operator==(const MyValueType& other) const { return value == other.value; }
    bool operator!=(const MyValueType& other) const { return !(*this == other); }
};

struct MyType {
    MyValueType value;
};

class MyTypeValidator : public AbstractValidator<MyType> {
public:
    MyTypeValidator() {
        ruleFor("Value", &MyType::value).notEqual(MyValueType{});
    }
};

} // namespace

class NotEqualValidatorTest : public ValidatorTestBase {};

// ============================================================================
// Fixed value
// ============================================================================

TEST_F(NotEqualValidatorTest, DifferentValues_Pass) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Forename", &Person::forename).notEqual("Foo");
    });
    EXPECT_TRUE(validator.validate(personWithForename("Bar")).isValid());
}

TEST_F(NotEqualValidatorTest, SameValue_Fail) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Forename", &Person::forename).notEqual("Foo");
    });
    auto result = validator.validate(personWithForename("Foo"));
    EXPECT_FALSE(result.isValid());
}

TEST_F(NotEqualValidatorTest, Failure_SetsDefaultMessage) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Forename", &Person::forename).notEqual("Foo");
    });
    auto result = validator.validate(personWithForename("Foo"));
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].errorMessage, "'Forename' must not be equal to 'Foo'.");
    EXPECT_EQ(result.errors()[0].errorCode, "NotEqualValidator");
}

TEST_F(NotEqualValidatorTest, OrdinalComparisonByDefault) {
    TestValidator validator;
    validator.ruleFor("Surname", &Person::surname).notEqual("a");
    auto result = validator.validate(personWithSurname(std::string("a\0", 2)));
    EXPECT_TRUE(result.isValid());
}

TEST_F(NotEqualValidatorTest, CaseInsensitiveComparer_Fail) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Surname", &Person::surname).notEqual("FOO", StringComparer::ordinalIgnoreCase());
    });
    EXPECT_FALSE(validator.validate(personWithSurname("foo")).isValid());
}

TEST_F(NotEqualValidatorTest, ValueTypeWithoutStreamOperator_Fail) {
    MyTypeValidator validator;
    auto result = validator.validate(MyType{});
    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].errorMessage, "'Value' must not be equal to ''.");
    EXPECT_EQ(result.errors()[0].attemptedValue, "");
}

TEST_F(NotEqualValidatorTest, ValueTypeWithoutStreamOperator_Pass) {
    MyTypeValidator validator;
    MyType instance;
    instance.value.value = 1;
    EXPECT_TRUE(validator.validate(instance).isValid());
}

// ============================================================================
// Another property
// ============================================================================

TEST_F(NotEqualValidatorTest, ValidatesAgainstProperty) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Surname", &Person::surname)
            .notEqual(property("Forename", &Person::forename))
            .withMessage("{ComparisonProperty}");
    });
    Person person;
    person.surname = "foo";
    person.forename = "foo";

    auto result = validator.validate(person);
    EXPECT_FALSE(result.isValid());
    ASSERT_FALSE(result.errors().empty());
    EXPECT_EQ(result.errors()[0].errorMessage, "Forename");
}

TEST_F(NotEqualValidatorTest, ComparisonProperty_UsesCustomResolver) {
    DisplayNameResolverScope scope([](const std::type_index&, const MemberInfo& member) {
        return member.name + "Foo";
    });

    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Surname", &Person::surname)
            .notEqual(property("Forename", &Person::forename))
            .withMessage("{ComparisonProperty}");
    });
    Person person;
    person.surname = "foo";
    person.forename = "foo";

    auto result = validator.validate(person);
    ASSERT_FALSE(result.errors().empty());
    EXPECT_EQ(result.errors()[0].errorMessage, "ForenameFoo");
}

TEST_F(NotEqualValidatorTest, CaseInsensitiveComparerAgainstProperty_Fail) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Surname", &Person::surname)
            .notEqual(property("Forename", &Person::forename), StringComparer::ordinalIgnoreCase());
    });
    Person person;
    person.surname = "foo";
    person.forename = "FOO";

    EXPECT_FALSE(validator.validate(person).isValid());
}

TEST_F(NotEqualValidatorTest, ResolverScope_RestoresPreviousResolver) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Surname", &Person::surname)
            .notEqual(property("Forename", &Person::forename))
            .withMessage("{ComparisonProperty}");
    });
    {
        DisplayNameResolverScope scope([](const std::type_index&, const MemberInfo&) {
            return std::string("Scoped");
        });
        EXPECT_EQ(validator.validate(Person{}).errors()[0].errorMessage, "Scoped");
    }
    EXPECT_EQ(validator.validate(Person{}).errors()[0].errorMessage, "Forename");
}

// ============================================================================
// Stored metadata
// ============================================================================

TEST_F(NotEqualValidatorTest, StoresPropertyToCompare) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Forename", &Person::forename).notEqual(property("Surname", &Person::surname));
    });

    auto components = validator.createDescriptor().getValidatorsForMember("Forename");
    ASSERT_EQ(components.size(), 1u);
    auto* comparison = dynamic_cast<const IComparisonValidator*>(&components[0]->validator());
    ASSERT_NE(comparison, nullptr);
    ASSERT_TRUE(comparison->memberToCompare().has_value());
    EXPECT_TRUE(*comparison->memberToCompare() == memberOf<Person>("Surname"));
    EXPECT_EQ(comparison->comparison(), Comparison::NOT_EQUAL);
}

TEST_F(NotEqualValidatorTest, StoresComparisonValue) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("Forename", &Person::forename).notEqual("Foo");
    });

    auto components = validator.createDescriptor().getValidatorsForMember("Forename");
    ASSERT_EQ(components.size(), 1u);
    auto* notEqual = dynamic_cast<const NotEqualValidator<Person, std::string>*>(&components[0]->validator());
    ASSERT_NE(notEqual, nullptr);
    EXPECT_TRUE(notEqual->hasValueToCompare());
    EXPECT_EQ(*notEqual->valueToCompare(), "Foo");
    EXPECT_FALSE(notEqual->memberToCompare().has_value());
}

// ============================================================================
// Nullable properties
// ============================================================================

TEST_F(NotEqualValidatorTest, EmptyOptional_DiffersFromValue) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("NullableInt", &Person::nullableInt).notEqual(5);
    });
    EXPECT_TRUE(validator.validate(Person{}).isValid());
}

TEST_F(NotEqualValidatorTest, EmptyOptionals_AreEqual) {
    TestValidator validator([](TestValidator& v) {
        v.ruleFor("NullableInt", &Person::nullableInt)
            .notEqual(property<Person, std::optional<int>>("Other", [](const Person&) {
                return std::optional<int>();
            }));
    });
    EXPECT_FALSE(validator.validate(Person{}).isValid());
}
