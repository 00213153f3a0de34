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
#include "StopWatch.h"

#include <ctime>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the StopWatch class. */

StopWatch::StopWatch() :
    m_startMS(0ULL)
{
    start();
}

/* Finalizes a instance of the StopWatch class. */

StopWatch::~StopWatch() = default;

/* Gets the current monotonic time. */

ulong64_t StopWatch::now()
{
    struct timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);

    return ts.tv_sec * 1000ULL + ts.tv_nsec / 1000000ULL;
}

/* Starts (or restarts) the stopwatch. */

ulong64_t StopWatch::start()
{
    m_startMS = now();
    return m_startMS;
}

/* Gets the elapsed time since the stopwatch started. */

uint32_t StopWatch::elapsed() const
{
    return (uint32_t)(now() - m_startMS);
}
