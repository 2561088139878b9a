// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include <cstdio>

// --------------------------------------------------------------------------------------------------------------------

// print debug messages for development
// 1 = probing progress, 2 = also let libasound print its own errors
#ifndef ASOUND_PROBE_DEBUG
#define ASOUND_PROBE_DEBUG 0
#endif

// how many distinct rates or channel counts a linear scan may collect
// reaching this many means the endpoint converts internally and is not real hardware
#ifndef ASOUND_PROBE_MAX_ENUMERATED_VALUES
#define ASOUND_PROBE_MAX_ENUMERATED_VALUES 100
#endif

// absolute sample rate bounds, in Hz
#ifndef ASOUND_PROBE_MIN_RATE
#define ASOUND_PROBE_MIN_RATE 8000
#endif
#ifndef ASOUND_PROBE_MAX_RATE
#define ASOUND_PROBE_MAX_RATE 768000
#endif

// absolute channel count ceiling
#ifndef ASOUND_PROBE_MAX_CHANNELS
#define ASOUND_PROBE_MAX_CHANNELS 255
#endif

// highest channel count tried after a channel scan overflows
#ifndef ASOUND_PROBE_FALLBACK_MAX_CHANNELS
#define ASOUND_PROBE_FALLBACK_MAX_CHANNELS 12
#endif

// absolute buffer time bounds, in microseconds
#ifndef ASOUND_PROBE_MIN_BUFFER_TIME_US
#define ASOUND_PROBE_MIN_BUFFER_TIME_US 1000
#endif
#ifndef ASOUND_PROBE_MAX_BUFFER_TIME_US
#define ASOUND_PROBE_MAX_BUFFER_TIME_US 1000000
#endif

// period time is derived as buffer time divided by this
#ifndef ASOUND_PROBE_PERIODS_PER_BUFFER
#define ASOUND_PROBE_PERIODS_PER_BUFFER 5
#endif

#define ASOUND_PROBE_US_PER_MS 1000

// --------------------------------------------------------------------------------------------------------------------

// one locked write per line, workers print concurrently
#define ASOUND_PROBE_PRINT_LINE(...) \
    { flockfile(stderr); fprintf(stderr, __VA_ARGS__); fputc('\n', stderr); funlockfile(stderr); }

#if ASOUND_PROBE_DEBUG
#define DEBUGPRINT(...) ASOUND_PROBE_PRINT_LINE(__VA_ARGS__)
#else
#define DEBUGPRINT(...) {}
#endif

#define WARNPRINT(...) ASOUND_PROBE_PRINT_LINE(__VA_ARGS__)

// --------------------------------------------------------------------------------------------------------------------
