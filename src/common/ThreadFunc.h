// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2023 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @file ThreadFunc.h
 * @ingroup threading
 */
#if !defined(__THREAD_FUNC_H__)
#define __THREAD_FUNC_H__

#include "common/Thread.h"

#include <functional>
#include <string>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Creates and controls a named worker thread whose main is an anonymous lambda function.
 * @ingroup threading
 */
class CPS_SW_API ThreadFunc : public Thread {
public:
    /**
     * @brief Initializes a new instance of the ThreadFunc class.
     * @param name Name of the thread (truncated to 15 characters by the kernel).
     * @param e Anonymous function to use as the thread main.
     */
    ThreadFunc(const std::string& name, std::function<void()>&& e) : Thread(),
        m_name(name),
        m_entry(std::move(e))
    {
        /* stub */
    }

    /**
     * @brief Starts the thread and applies its name.
     * @returns bool True, if the thread started, otherwise false.
     */
    bool start()
    {
        if (!run())
            return false;

        setName(m_name);
        return true;
    }

    /**
     * @brief Runs the anonymous function as the thread main.
     */
    void entry() override
    {
        if (m_entry != nullptr)
            m_entry();
    }

    /**
     * @brief Gets the name of the thread.
     * @returns std::string Thread name.
     */
    std::string getName() const { return m_name; }

private:
    std::string m_name;
    std::function<void()> m_entry;
};

#endif // __THREAD_FUNC_H__
