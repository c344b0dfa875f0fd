/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-debug.hpp
 * @brief Diagnostic print macro that disappears from release builds.
 *
 * PRELAY_DEBUG_PRINT(stmt) evaluates the stream statement when NDEBUG is
 * not defined, and expands to an empty statement otherwise. The argument
 * is not evaluated in release builds, so it must not carry side effects
 * the program relies on.
 *
 *   PRELAY_DEBUG_PRINT(std::cerr << "accept: " << strerror(errno) << "\n");
 */

#ifndef PRELAY_DEBUG_HPP_
#define PRELAY_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define PRELAY_DEBUG_PRINT(print_stmt)                                         \
  do {                                                                         \
  } while (false)
#else
#define PRELAY_DEBUG_PRINT(print_stmt)                                         \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#endif // PRELAY_DEBUG_HPP_
