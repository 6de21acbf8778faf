// Part of SimSpec - A ZX Spectrum emulator
//
// SimSpec.h: Common header used by all modules
//
//  Copyright (c) 1999-2024 Simon Owen
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation; either version 2 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program; if not, write to the Free Software
// Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

#pragma once

#include "config.h"

#ifdef __cplusplus

#if defined(DEBUG) && !defined(_DEBUG)
#define _DEBUG
#endif

#ifdef _WIN32
#define _CRT_SECURE_NO_WARNINGS
#define _CRT_NONSTDC_NO_DEPRECATE
#define NOMINMAX    // no min/max macros from windef.h
#endif

#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <stdint.h>
#include <ctype.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

#include <fmt/format.h>

#include "OSD.h"        /* OS-dependent stuff */
#include "Util.h"       /* TRACE macro and other utility functions */

#include "libspectrum.h"
#include "zlib.h"       /* for gzopen, gzclose, etc. */

#endif  /* __cplusplus */
