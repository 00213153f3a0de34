// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2023,2024 Bryan Biedenkapp, N2PLL
 *
 */
#include "Thread.h"
#include "Log.h"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <unistd.h>

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the Thread class. */

Thread::Thread() :
    m_thread(),
    m_joined(false),
    m_started(false)
{
    /* stub */
}

/* Finalizes a instance of the Thread class. */

Thread::~Thread() = default;

/* Starts the thread execution. */

bool Thread::run()
{
    if (m_started)
        return m_started;

    int err = ::pthread_create(&m_thread, NULL, helper, this);
    if (err != 0) {
        LogError(LOG_HOST, "Error returned from pthread_create, err: %d (%s)", err, strerror(err));
        return false;
    }

    m_started = true;
    m_joined = false;
    return true;
}

/* Make calling thread wait for termination of the thread. */

void Thread::wait()
{
    if (!m_started || m_joined)
        return;

    ::pthread_join(m_thread, NULL);
    m_joined = true;
}

/* Set thread name visible in the kernel and its interfaces. */

void Thread::setName(std::string name)
{
    if (!m_started || m_joined)
        return;

#ifdef _GNU_SOURCE
    if (name.length() > 15U)
        name = name.substr(0U, 15U);
    ::pthread_setname_np(m_thread, name.c_str());
#endif // _GNU_SOURCE
}

/* Helper to determine if the calling thread is this thread. */

bool Thread::isCurrent() const
{
    if (!m_started)
        return false;

    return ::pthread_equal(m_thread, ::pthread_self()) != 0;
}

/* Suspends the current thread for the specified amount of time. */

void Thread::sleep(uint32_t ms, uint32_t us)
{
    if (us > 0U) {
        ::usleep(us);
    }
    else {
        ::usleep(ms * 1000U);
    }
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Internal helper thats used as the entry point for the thread. */

void* Thread::helper(void* arg)
{
    Thread* p = (Thread*)arg;
    p->entry();

    return nullptr;
}
