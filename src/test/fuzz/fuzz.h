// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_TEST_FUZZ_FUZZ_H
#define ABIFUZZ_TEST_FUZZ_FUZZ_H

#include <util/logging.h>

#include <cstddef>
#include <cstdint>

/**
 * libFuzzer integration for abifuzz
 *
 * Each target exercises one engine entry point with arbitrary input and
 * must never crash, hang or trip a sanitizer. Errors the engine reports
 * through exceptions are expected and caught by the target.
 */

/**
 * FUZZ_TARGET macro - Define a fuzz harness entry point
 *
 * Usage:
 *   FUZZ_TARGET(my_component)
 *   {
 *       // Fuzz logic here using data/size
 *   }
 */
#define FUZZ_TARGET(name) \
    void fuzz_target_##name(const uint8_t* data, size_t size); \
    extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) { \
        InitializeFuzzEnvironment(); \
        fuzz_target_##name(data, size); \
        return 0; \
    } \
    void fuzz_target_##name(const uint8_t* data, size_t size)

/**
 * Silence engine logging so that per-input DEBUG/INFO output does not
 * dominate fuzzing throughput. Only errors still reach the console.
 */
inline void InitializeFuzzEnvironment() {
    static bool initialized = false;
    if (initialized) return;
    CLoggingConfig::GetInstance().SetLogLevel(LogLevel::LVL_ERROR);
    initialized = true;
}

#endif // ABIFUZZ_TEST_FUZZ_FUZZ_H
