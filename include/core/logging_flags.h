#pragma once

#include <atomic>

/**
 * @brief Global logging flags set from the command line
 *
 * Definitions live in src/main.cpp (and tests/test_main.cpp for the test
 * binary).
 */
extern std::atomic<bool> g_log_api;

/**
 * @brief Check if per request API logging is enabled (--log-api)
 */
inline bool isApiLoggingEnabled() { return g_log_api.load(); }
