#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime invariant check that is never compiled out.
 *
 * Reserved for conditions that can only fail through a programming error (an evaluation
 * result for an index that was never queued, a ranked list that lost an entry). Invalid user
 * input is reported through Result instead.
 *
 * On failure the message, location and condition are logged at CRITICAL, the default logger is
 * flushed so the file sink keeps the message, and the process aborts.
 *
 * Example:
 *   DASHSIM_ASSERT(records.size() == population.size(), "Every individual needs a record");
 */
#define DASHSIM_ASSERT(condition, message)                                                  \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            spdlog::default_logger()->flush();                                              \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
