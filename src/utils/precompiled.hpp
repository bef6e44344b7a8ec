/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_PRECOMPILED_HPP_INCLUDED__
#define __RCONLINK_PRECOMPILED_HPP_INCLUDED__

#define __STDC_LIMIT_MACROS

//  rconlink definitions and exported functions
#include "../include/rconlink.h"

#ifdef _MSC_VER

// standard C headers
#include <errno.h>
#include <limits.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// standard C++ headers
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

#endif // _MSC_VER

#endif
