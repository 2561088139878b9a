// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-capabilities.hpp"
#include "probe-trial.hpp"

#include <algorithm>

// --------------------------------------------------------------------------------------------------------------------

static const char* getProbeParamName(const ProbeParam param)
{
    switch (param)
    {
    case kProbeParamFormat:
        return "formats";
    case kProbeParamRate:
        return "sampling rates";
    case kProbeParamChannels:
        return "channel counts";
    case kProbeParamBufferTime:
        return "buffer times";
    case kProbeParamPeriodTime:
        return "period times";
    }

    return "";
}

static ProbeTrial makeSingleParamTrial(const ProbeParam param, const uint32_t value)
{
    ProbeTrial trial;

    switch (param)
    {
    case kProbeParamFormat:
        trial.format = static_cast<SampleFormat>(value);
        break;
    case kProbeParamRate:
        trial.rate = value;
        break;
    case kProbeParamChannels:
        trial.channels = value;
        break;
    case kProbeParamBufferTime:
        trial.bufferTimeUs = value;
        break;
    case kProbeParamPeriodTime:
        trial.periodTimeUs = value;
        break;
    }

    return trial;
}

// clamp reported bounds to the absolute ones, reported bounds are only a hint
static void getScanBounds(const ProbeEndpoint& endpoint,
                          const ProbeParam param,
                          const uint32_t absMin,
                          const uint32_t absMax,
                          uint32_t& min,
                          uint32_t& max)
{
    min = absMin;
    max = absMax;

    uint32_t reportedMin, reportedMax;
    if (queryProbeTrialBounds(endpoint.name.c_str(), endpoint.playback, ProbeTrial(), param, reportedMin, reportedMax))
    {
        min = std::max(reportedMin, absMin);
        max = std::min(reportedMax, absMax);
    }
    else
    {
        DEBUGPRINT("%s: %s bounds unknown, scanning %u..%u",
                   endpoint.name.c_str(), getProbeParamName(param), absMin, absMax);
    }
}

// --------------------------------------------------------------------------------------------------------------------

bool scanCapabilityRange(const ProbePolicy& policy,
                         const ProbeEndpoint& endpoint,
                         const ProbeParam param,
                         const uint32_t min,
                         const uint32_t max,
                         const std::vector<uint32_t>& fallback,
                         std::vector<uint32_t>& values)
{
    const char* const name = endpoint.name.c_str();
    bool overflow = false;

    values.clear();

    // 64bit counter so max == UINT32_MAX terminates
    for (uint64_t v64 = min; v64 <= max; ++v64)
    {
        const uint32_t v = static_cast<uint32_t>(v64);

        if (! runProbeTrial(name, endpoint.playback, makeSingleParamTrial(param, v), false))
            continue;

        values.push_back(v);

        if (values.size() >= policy.maxEnumeratedValues)
        {
            overflow = true;
            break;
        }
    }

    if (! overflow)
        return true;

    WARNPRINT("%s is reporting an unusually large number of supported %s (%u+).",
              name, getProbeParamName(param), policy.maxEnumeratedValues);
    WARNPRINT("%s is more than likely not a real hardware device, "
              "but is actually a hardware device behind a plug plugin.", name);

    values.clear();

    for (const uint32_t v : fallback)
    {
        if (v < min || v > max)
            continue;

        if (runProbeTrial(name, endpoint.playback, makeSingleParamTrial(param, v), false))
            values.push_back(v);
    }

    return false;
}

bool probeCapabilities(const ProbePolicy& policy, ProbeEndpoint& endpoint)
{
    const char* const name = endpoint.name.c_str();

    // ----------------------------------------------------------------------------------------------------------------
    // identity

    ProbeDeviceInfo info;

    if (! readProbeDeviceInfo(name, endpoint.playback, info))
    {
        DEBUGPRINT("%s: can't open, skipped", name);
        return false;
    }

    if (! info.description.empty())
        endpoint.description = info.description;
    else if (endpoint.description.empty())
        endpoint.description = "NONE";

    endpoint.deviceNumber = info.deviceNumber;
    endpoint.subDeviceNumber = info.subDeviceNumber;

    // several sub-devices means the card mixes streams itself
    endpoint.hasBuiltinMixer = info.subDeviceCount > 1;
    endpoint.isRealHardware = true;

    CapabilitySet& caps = endpoint.caps;
    caps = CapabilitySet();

    // ----------------------------------------------------------------------------------------------------------------
    // sample formats

    for (const SampleFormat format : policy.formats)
    {
        ProbeTrial trial;
        trial.format = format;

        if (runProbeTrial(name, endpoint.playback, trial, false))
            caps.formats.push_back(format);
    }

    // every candidate format can be mixed by dmix/dsnoop
    endpoint.softwareMixable = ! caps.formats.empty();

    if (! endpoint.softwareMixable)
    {
        WARNPRINT("%s does not support any formats supported by dmix/dsnoop.", name);
        WARNPRINT("%s is not software mixable, and will be ignored.", name);
        return false;
    }

    // ----------------------------------------------------------------------------------------------------------------
    // sample rates

    uint32_t min, max;
    getScanBounds(endpoint, kProbeParamRate, policy.minRate, policy.maxRate, min, max);

    if (! scanCapabilityRange(policy, endpoint, kProbeParamRate, min, max, policy.fallbackRates, caps.rates))
        endpoint.isRealHardware = false;

    // ----------------------------------------------------------------------------------------------------------------
    // channel counts

    getScanBounds(endpoint, kProbeParamChannels, policy.minChannels, policy.maxChannels, min, max);

    if (! scanCapabilityRange(policy, endpoint, kProbeParamChannels, min, max, policy.fallbackChannels, caps.channels))
        endpoint.isRealHardware = false;

    DEBUGPRINT("%s: %zu formats, %zu rates, %zu channel counts, real hardware %d",
               name, caps.formats.size(), caps.rates.size(), caps.channels.size(), endpoint.isRealHardware);

    return ! caps.rates.empty() && ! caps.channels.empty();
}

// --------------------------------------------------------------------------------------------------------------------
