/**
 * @file test_error.cpp
 * @brief Unit tests for the exception hierarchy and error logging
 */

#include <gtest/gtest.h>
#include <philbrick/core/Error.hpp>
#include <philbrick/core/ErrorLogging.hpp>

#include <string>
#include <vector>

namespace philbrick {
namespace {

bool Contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

// =============================================================================
// Error base
// =============================================================================

TEST(Error, PrefixesMessage) {
    Error e("something broke");
    EXPECT_STREQ(e.what(), "[philbrick] something broke");
    EXPECT_EQ(e.severity(), Severity::ERROR);
    EXPECT_EQ(e.category(), "general");
}

TEST(Error, DerivedErrorsAreCatchableAsBase) {
    EXPECT_THROW(throw ConfigError("x"), Error);
    EXPECT_THROW(throw WiringError("x"), Error);
    EXPECT_THROW(throw IOError("x"), Error);
    EXPECT_THROW(throw CircuitError::UnknownType("X"), Error);
    EXPECT_THROW(throw CircuitError::UnknownType("X"), std::runtime_error);
}

// =============================================================================
// CircuitError
// =============================================================================

TEST(CircuitError, UnknownTypeListsRegistered) {
    auto e = CircuitError::UnknownType("Flux", "Exp, Summer");
    EXPECT_EQ(e.kind(), CircuitErrorKind::UnknownType);
    EXPECT_EQ(e.subject(), "Flux");
    EXPECT_TRUE(Contains(e.what(), "Unknown component type: 'Flux'"));
    EXPECT_TRUE(Contains(e.what(), "registered types: Exp, Summer"));
    EXPECT_EQ(e.category(), "circuit");
}

TEST(CircuitError, UnknownPortNamesDirection) {
    auto e = CircuitError::UnknownPort("INT1", "bogus", true);
    EXPECT_EQ(e.kind(), CircuitErrorKind::UnknownPort);
    EXPECT_EQ(e.subject(), "INT1.bogus");
    EXPECT_TRUE(Contains(e.what(), "no output port 'bogus'"));

    auto in = CircuitError::UnknownPort("INT1", "bogus", false);
    EXPECT_TRUE(Contains(in.what(), "no input port 'bogus'"));
}

TEST(CircuitError, MalformedReferenceShowsExpectedFormat) {
    auto e = CircuitError::MalformedReference("nodot");
    EXPECT_EQ(e.kind(), CircuitErrorKind::MalformedReference);
    EXPECT_TRUE(Contains(e.what(), "component_name.port_name"));
}

TEST(CircuitError, PortMappingSuggestsMap) {
    auto in = CircuitError::PortMapping("SM1", "x", false);
    EXPECT_EQ(in.kind(), CircuitErrorKind::PortMappingError);
    EXPECT_EQ(in.subject(), "SM1.x");
    EXPECT_TRUE(Contains(in.what(), "input_map"));

    auto out = CircuitError::PortMapping("SM1", "y", true);
    EXPECT_TRUE(Contains(out.what(), "output_map"));
}

TEST(CircuitError, CyclicTemplateCarriesChain) {
    auto e = CircuitError::CyclicTemplate("A", "A -> B -> A");
    EXPECT_EQ(e.kind(), CircuitErrorKind::CyclicTemplate);
    EXPECT_TRUE(Contains(e.what(), "A -> B -> A"));
}

TEST(CircuitError, RemainingFactoriesSetKind) {
    EXPECT_EQ(CircuitError::UnknownComponent("X").kind(), CircuitErrorKind::UnknownComponent);
    EXPECT_EQ(CircuitError::DuplicateRegistration("X").kind(),
              CircuitErrorKind::DuplicateRegistration);
    EXPECT_EQ(CircuitError::ParameterMismatch("X", "d").kind(),
              CircuitErrorKind::ParameterMismatch);
}

// =============================================================================
// ConfigError / WiringError / IOError
// =============================================================================

TEST(ConfigError, SimpleMessage) {
    ConfigError e("bad value");
    EXPECT_STREQ(e.what(), "[philbrick] Config: bad value");
    EXPECT_TRUE(e.file().empty());
    EXPECT_EQ(e.line(), -1);
}

TEST(ConfigError, FileLineAndHint) {
    ConfigError e("unexpected key", "osc.yaml", 12, "check indentation");
    EXPECT_EQ(e.file(), "osc.yaml");
    EXPECT_EQ(e.line(), 12);
    EXPECT_EQ(e.hint(), "check indentation");
    EXPECT_TRUE(Contains(e.what(), "at: osc.yaml:12"));
    EXPECT_TRUE(Contains(e.what(), "hint: check indentation"));
}

TEST(WiringError, NamesBothEndpoints) {
    WiringError e("A.in", "B.in", "source must be an output port");
    EXPECT_EQ(e.source(), "A.in");
    EXPECT_EQ(e.dest(), "B.in");
    EXPECT_TRUE(Contains(e.what(), "'A.in' -> 'B.in'"));
}

TEST(IOError, CarriesPath) {
    IOError e("open", "/nonexistent/out.csv", "permission denied");
    EXPECT_EQ(e.path(), "/nonexistent/out.csv");
    EXPECT_TRUE(Contains(e.what(), "open '/nonexistent/out.csv'"));
}

// =============================================================================
// Error logging
// =============================================================================

class ErrorLoggingTest : public ::testing::Test {
  protected:
    void SetUp() override {
        GetLogService().ClearSinks();
        GetLogService().ResetErrorCount();
        GetLogService().AddSink(LogSinks::Collect(entries));
    }

    void TearDown() override {
        GetLogService().ClearSinks();
        GetLogService().ResetErrorCount();
    }

    std::vector<LogEntry> entries;
};

TEST_F(ErrorLoggingTest, SeverityMapsToLevel) {
    EXPECT_EQ(SeverityToLogLevel(Severity::INFO), LogLevel::Info);
    EXPECT_EQ(SeverityToLogLevel(Severity::WARNING), LogLevel::Warning);
    EXPECT_EQ(SeverityToLogLevel(Severity::ERROR), LogLevel::Error);
    EXPECT_EQ(SeverityToLogLevel(Severity::FATAL), LogLevel::Fatal);
}

TEST_F(ErrorLoggingTest, LogErrorEmitsEntry) {
    LogError(ConfigError("broken"), 1.5, "loader");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
    EXPECT_DOUBLE_EQ(entries[0].time, 1.5);
    EXPECT_EQ(entries[0].context.component, "loader");
    EXPECT_EQ(GetLogService().ErrorCount(), 1u);
}

TEST_F(ErrorLoggingTest, LogErrorKeepsEnclosingCircuit) {
    ScopedLogContext ctx("osc", "INT1");
    LogError(CircuitError::UnknownType("Nope"));
    LogError(WiringError("A.in", "B.in", "source must be an output port"), 0.0, "B");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(Contains(entries[0].message, "Nope"));
    EXPECT_EQ(entries[0].context.Path(), "osc.INT1");
    EXPECT_EQ(entries[1].context.Path(), "osc.B");
}

} // namespace
} // namespace philbrick
