#include <catch2/catch_test_macros.hpp>

#include <toolsrv/core/terminal.hpp>

#include <cstdlib>

using namespace toolsrv;

// ===========================================================================
// Terminal detection: basic smoke tests.
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("ResolveLogColor: forced off wins", "[core][terminal]") {
    CHECK_FALSE(ResolveLogColor(false, true));
    CHECK_FALSE(ResolveLogColor(true, true));
}

TEST_CASE("ResolveLogColor: NO_COLOR disables even when forced on", "[core][terminal]") {
    ::setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    CHECK_FALSE(ResolveLogColor(true, false));
    ::unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}

TEST_CASE("ResolveLogColor: forced on without NO_COLOR", "[core][terminal]") {
    ::unsetenv("NO_COLOR");
    CHECK(ResolveLogColor(true, false));
}
