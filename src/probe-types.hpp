// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// --------------------------------------------------------------------------------------------------------------------

// all sample formats here are native endian and can be mixed by dmix/dsnoop
enum SampleFormat {
    kSampleFormatInvalid = 0,
    kSampleFormat8,
    kSampleFormat16,
    kSampleFormat24Packed,
    kSampleFormat24,
    kSampleFormat32
};

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define ASOUND_PROBE_ENDIAN "BE"
#else
#define ASOUND_PROBE_ENDIAN "LE"
#endif

// name as used in alsa configuration files
static inline
const char* getSampleFormatName(const SampleFormat format)
{
    switch (format)
    {
    case kSampleFormatInvalid:
        break;
    case kSampleFormat8:
        return "U8";
    case kSampleFormat16:
        return "S16_" ASOUND_PROBE_ENDIAN;
    case kSampleFormat24Packed:
        return "S24_3" ASOUND_PROBE_ENDIAN;
    case kSampleFormat24:
        return "S24_" ASOUND_PROBE_ENDIAN;
    case kSampleFormat32:
        return "S32_" ASOUND_PROBE_ENDIAN;
    }

    return "";
}

// --------------------------------------------------------------------------------------------------------------------

// formats, rates and channels an endpoint accepts, in probing order
struct CapabilitySet {
    std::vector<SampleFormat> formats;
    std::vector<uint32_t> rates;
    std::vector<uint32_t> channels;
};

// a format/rate/channels combination that fully committed on a fresh session
// does not change after creation
struct ValidConfiguration {
    // endpoint identity
    std::string name;
    std::string cardKey;
    uint32_t deviceNumber = 0;
    uint32_t subDeviceNumber = 0;
    bool playback = true;
    bool isRealHardware = true;

    SampleFormat format = kSampleFormatInvalid;
    uint32_t rate = 0;
    uint32_t channels = 0;

    // buffer window in microseconds and its default recommendation in milliseconds
    // only filled when buffer windows are probed, bufferTimeMs is 0 otherwise
    uint32_t bufferTimeMinUs = 0;
    uint32_t bufferTimeMaxUs = 0;
    uint32_t bufferTimeMs = 0;
};

struct ProbeEndpoint {
    std::string name;
    std::string description;
    std::string cardKey;
    bool playback = true;
    uint32_t deviceNumber = 0;
    uint32_t subDeviceNumber = 0;

    bool softwareMixable = false;
    bool hasBuiltinMixer = false;
    bool isRealHardware = true;

    // filtered after the configuration search, every value is used by some configuration
    CapabilitySet caps;
    std::vector<ValidConfiguration> configs;
};

struct ProbeResults {
    std::vector<ProbeEndpoint> playback;
    std::vector<ProbeEndpoint> capture;
};

// --------------------------------------------------------------------------------------------------------------------
