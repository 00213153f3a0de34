// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016,2017 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2025 Bryan Biedenkapp, N2PLL
 *
 */
/**
 * @defgroup common Common Library
 * @brief Codeplug Programming Engine - Common Library
 * @details This library implements common core code used by the protocol engine and the programming tool.
 * @ingroup common
 *
 * @file Defines.h
 * @ingroup common
 */
#pragma once
#if !defined(__COMMON_DEFINES_H__)
#define __COMMON_DEFINES_H__

#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <ios>
#include <algorithm>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
//  Types
// ---------------------------------------------------------------------------

#ifndef __LONG64_TYPE__
typedef long long           long64_t;
#endif // __LONG64_TYPE__
#ifndef __ULONG64_TYPE__
typedef unsigned long long  ulong64_t;
#endif // __ULONG64_TYPE__

#if defined(__GNUC__) || defined(__GNUG__)
#define __forceinline __attribute__((always_inline))
#endif

// ---------------------------------------------------------------------------
//  Meta-Programming Macro Includes
// ---------------------------------------------------------------------------

#include "common/ClassProperties.h"
#include "common/BitManipulation.h"
#include "common/VariableLengthArray.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#ifndef __GIT_VER__
#define __GIT_VER__ "00000000"
#endif
#ifndef __GIT_VER_HASH__
#define __GIT_VER_HASH__ "00000000"
#endif

#define __PROG_NAME__ ""
#define __EXE_NAME__ ""

#define VERSION_MAJOR       "01"
#define VERSION_MINOR       "04"
#define VERSION_REV         "A"

#define __VER__ VERSION_MAJOR "." VERSION_MINOR VERSION_REV " (R" VERSION_MAJOR VERSION_REV VERSION_MINOR " " __GIT_VER__ ")"

#define __BUILD__ __DATE__ " " __TIME__
#if !defined(NDEBUG)
#undef __BUILD__
#define __BUILD__ __DATE__ " " __TIME__ " DEBUG"
#endif // DEBUG

#define CPS_SW_API

/**
 * @addtogroup common
 * @{
 */

#define DEFAULT_RADIO_ADDRESS "192.168.10.1"

const uint16_t  XNL_DEFAULT_PORT = 8002U;

const uint32_t  DEFAULT_AUTH_TIMEOUT_MS = 10000U;
const uint32_t  DEFAULT_READY_TIMEOUT_MS = 15000U;
const uint32_t  DEFAULT_COMMAND_TIMEOUT_MS = 5000U;
const uint32_t  DEFAULT_COMMAND_RETRIES = 3U;

/** @} */

#endif // __COMMON_DEFINES_H__
