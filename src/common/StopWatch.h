// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup timers Timers
 * @brief Defines and implements monotonic timing routines.
 * @ingroup common
 *
 * @file StopWatch.h
 * @ingroup timers
 * @file StopWatch.cpp
 * @ingroup timers
 */
#if !defined(__STOPWATCH_H__)
#define __STOPWATCH_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Measures elapsed milliseconds against the monotonic clock.
 * @ingroup timers
 */
class CPS_SW_API StopWatch {
public:
    /**
     * @brief Initializes a new instance of the StopWatch class.
     */
    StopWatch();
    /**
     * @brief Finalizes a instance of the StopWatch class.
     */
    ~StopWatch();

    /**
     * @brief Gets the current monotonic time.
     * @returns ulong64_t Current monotonic time in milliseconds.
     */
    static ulong64_t now();

    /**
     * @brief Starts (or restarts) the stopwatch.
     * @returns ulong64_t Start time.
     */
    ulong64_t start();
    /**
     * @brief Gets the elapsed time since the stopwatch started.
     * @returns uint32_t Elapsed milliseconds.
     */
    uint32_t elapsed() const;

private:
    ulong64_t m_startMS;
};

#endif // __STOPWATCH_H__
