// SPDX-License-Identifier: GPL-2.0-only
/*
 * Codeplug Programming Engine - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2024 Bryan Biedenkapp, N2PLL
 *
 */
#if !defined(__TEST_DEFINES_H__)
#define __TEST_DEFINES_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#undef __PROG_NAME__
#define __PROG_NAME__ "Codeplug Programming Engine Tests"
#undef __EXE_NAME__
#define __EXE_NAME__ "cpstests"

#endif // __TEST_DEFINES_H__
