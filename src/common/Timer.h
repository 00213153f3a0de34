// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2010,2011,2014 Jonathan Naylor, G4KLX
 *  Copyright (C) 2017-2019 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file Timer.h
 * @ingroup timers
 * @file Timer.cpp
 * @ingroup timers
 */
#if !defined(__TIMER_H__)
#define __TIMER_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Simple millisecond timer that is clocked by its owner and marks if
 *  an expiration period has been reached.
 * @ingroup timers
 */
class CPS_SW_API Timer {
public:
    /**
     * @brief Initializes a new instance of the Timer class.
     */
    Timer();
    /**
     * @brief Initializes a new instance of the Timer class.
     * @param timeoutMs Number of milliseconds until timer expires.
     */
    explicit Timer(uint32_t timeoutMs);
    /**
     * @brief Finalizes a instance of the Timer class.
     */
    ~Timer();

    /**
     * @brief Sets the timeout for the timer.
     * @param timeoutMs Number of milliseconds until timer expires.
     */
    void setTimeout(uint32_t timeoutMs);
    /**
     * @brief Gets the timeout for the timer.
     * @returns uint32_t Timeout in milliseconds.
     */
    uint32_t getTimeout() const { return m_timeout; }

    /**
     * @brief Gets the remaining time before the timer expires.
     * @returns uint32_t Remaining milliseconds.
     */
    uint32_t getRemaining() const;

    /**
     * @brief Flag indicating whether the timer is running.
     * @return bool True, if the timer is still running, otherwise false.
     */
    bool isRunning() const { return m_running; }

    /**
     * @brief Starts the timer.
     */
    void start();
    /**
     * @brief Stops the timer.
     */
    void stop();

    /**
     * @brief Flag indicating whether or not the timer has reached timeout and expired.
     * @return bool True, if the timer is expired, otherwise false.
     */
    bool hasExpired() const;

    /**
     * @brief Updates the timer by the passed number of milliseconds.
     * @param ms Number of passed milliseconds.
     */
    void clock(uint32_t ms);

private:
    uint32_t m_timeout;
    uint32_t m_timer;
    bool m_running;
};

#endif // __TIMER_H__
