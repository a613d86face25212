// ═════════════════════════════════════════════════════════════
// WIREDOC: TEST RUNNER
// ═════════════════════════════════════════════════════════════
// Single test binary; suites live in tests/test_*.cpp.
// Run: ctest, or ./wiredoc_tests directly for doctest options.
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
