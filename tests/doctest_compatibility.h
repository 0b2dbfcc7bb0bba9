#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

#define DOCTEST_THREAD_LOCAL  // enable single-threaded builds on XCode, MINGW, etc.
#include <doctest/doctest.h>

// Catch-style aliases
#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
