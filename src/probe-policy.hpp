// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-config.hpp"
#include "probe-types.hpp"

// --------------------------------------------------------------------------------------------------------------------

static constexpr const SampleFormat kSampleFormatsToTry[] = {
    kSampleFormat8,
    kSampleFormat16,
    kSampleFormat24Packed,
    kSampleFormat24,
    kSampleFormat32,
};

// standard rates tried when a rate scan overflows
static constexpr const uint32_t kFallbackRatesToTry[] = {
    8000, 11025, 16000, 22050, 32000, 44100, 48000, 64000,
    88200, 96000, 176400, 192000, 352800, 384000, 705600, 768000,
};

// raw hardware namespaces, other hints are plugins and not probed
static constexpr const char* const kHardwareHintPrefixes[] = { "hw:", "hdmi:", "iec958:" };

// --------------------------------------------------------------------------------------------------------------------

// everything that steers a discovery pass
// defaults come from the ASOUND_PROBE_* macros and tables above
struct ProbePolicy {
    // linear scan ceiling, see ASOUND_PROBE_MAX_ENUMERATED_VALUES
    uint32_t maxEnumeratedValues = ASOUND_PROBE_MAX_ENUMERATED_VALUES;

    uint32_t minRate = ASOUND_PROBE_MIN_RATE;
    uint32_t maxRate = ASOUND_PROBE_MAX_RATE;
    uint32_t minChannels = 1;
    uint32_t maxChannels = ASOUND_PROBE_MAX_CHANNELS;

    std::vector<SampleFormat> formats;
    std::vector<uint32_t> fallbackRates;
    std::vector<uint32_t> fallbackChannels;
    std::vector<std::string> hintPrefixes;

    uint32_t minBufferTimeUs = ASOUND_PROBE_MIN_BUFFER_TIME_US;
    uint32_t maxBufferTimeUs = ASOUND_PROBE_MAX_BUFFER_TIME_US;
    uint32_t periodsPerBuffer = ASOUND_PROBE_PERIODS_PER_BUFFER;

    // query a buffer window for every verified configuration
    bool probeBufferWindows = false;

    bool probePlayback = true;
    bool probeCapture = true;

    ProbePolicy();
};

// --------------------------------------------------------------------------------------------------------------------
