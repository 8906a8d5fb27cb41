#pragma once
/********************************************************************************
 *                               Fanrelay Project                               *
 *                        Live Sports HLS Metadata Relay                        *
 *                                                                              *
 *  Copyright (c) 2025 The Fanrelay Authors                                     *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#if defined(__linux__)
#define FANRELAY_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FANRELAY_PLATFORM_APPLE 1
#else
#error "fanrelay only builds on Linux and macOS (POSIX sockets + Boost.Asio)"
#endif

#if defined(__clang__)
#define FANRELAY_COMPILER_CLANG 1
#elif defined(__GNUC__)
#define FANRELAY_COMPILER_GCC 1
#endif

// Visibility
#define FANRELAY_API __attribute__((visibility("default")))

#define FANRELAY_NODISCARD [[nodiscard]]

#define FANRELAY_VERSION_MAJOR 0
#define FANRELAY_VERSION_MINOR 3
#define FANRELAY_VERSION_PATCH 1
#define FANRELAY_VERSION_STR   "0.3.1"

#define FANRELAY_UNUSED(x)   (void)(x)
#define FANRELAY_LIKELY(x)   __builtin_expect(!!(x), 1)
#define FANRELAY_UNLIKELY(x) __builtin_expect(!!(x), 0)
