// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2010,2015 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2019 Bryan Biedenkapp, N2PLL
 *
 */
#include "Timer.h"

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Timer class. */

Timer::Timer() :
    m_timeout(0U),
    m_timer(0U),
    m_running(false)
{
    /* stub */
}

/* Initializes a new instance of the Timer class. */

Timer::Timer(uint32_t timeoutMs) :
    m_timeout(timeoutMs),
    m_timer(0U),
    m_running(false)
{
    /* stub */
}

/* Finalizes a instance of the Timer class. */

Timer::~Timer() = default;

/* Sets the timeout for the timer. */

void Timer::setTimeout(uint32_t timeoutMs)
{
    m_timeout = timeoutMs;
    if (m_timeout == 0U)
        stop();
}

/* Gets the remaining time before the timer expires. */

uint32_t Timer::getRemaining() const
{
    if (!m_running || m_timer >= m_timeout)
        return 0U;

    return m_timeout - m_timer;
}

/* Starts the timer. */

void Timer::start()
{
    m_timer = 0U;
    m_running = m_timeout > 0U;
}

/* Stops the timer. */

void Timer::stop()
{
    m_timer = 0U;
    m_running = false;
}

/* Flag indicating whether or not the timer has reached timeout and expired. */

bool Timer::hasExpired() const
{
    if (!m_running)
        return false;

    return m_timer >= m_timeout;
}

/* Updates the timer by the passed number of milliseconds. */

void Timer::clock(uint32_t ms)
{
    if (!m_running)
        return;

    // saturate instead of wrapping on very long sessions
    if (m_timeout - m_timer < ms && m_timer < m_timeout)
        m_timer = m_timeout;
    else
        m_timer += ms;
}
