// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-buffer.hpp"
#include "probe-trial.hpp"

#include <algorithm>

// --------------------------------------------------------------------------------------------------------------------

static ProbeTrial makeConfigurationTrial(const ValidConfiguration& config)
{
    ProbeTrial trial;
    trial.format = config.format;
    trial.rate = config.rate;
    trial.channels = config.channels;
    return trial;
}

static BufferWindow getDefaultBufferWindow(const ProbePolicy& policy)
{
    return { policy.minBufferTimeUs, policy.maxBufferTimeUs };
}

// --------------------------------------------------------------------------------------------------------------------

bool queryBufferWindow(const ProbePolicy& policy, const ValidConfiguration& config, BufferWindow& window)
{
    window = getDefaultBufferWindow(policy);

    uint32_t min, max;
    if (! queryProbeTrialBounds(config.name.c_str(), config.playback, makeConfigurationTrial(config),
                                kProbeParamBufferTime, min, max))
    {
        DEBUGPRINT("%s: buffer time bounds unknown, using %u..%u us",
                   config.name.c_str(), window.minUs, window.maxUs);
        return false;
    }

    // round inwards to whole milliseconds so every step lies inside the reported bounds
    // the minimum rounds up, flooring it would start the scan below what the device accepts
    const uint64_t minUs = (static_cast<uint64_t>(min) + ASOUND_PROBE_US_PER_MS - 1)
                         / ASOUND_PROBE_US_PER_MS * ASOUND_PROBE_US_PER_MS;
    const uint64_t maxUs = max / ASOUND_PROBE_US_PER_MS * ASOUND_PROBE_US_PER_MS;

    const uint32_t clampedMin = static_cast<uint32_t>(std::max<uint64_t>(minUs, policy.minBufferTimeUs));
    const uint32_t clampedMax = static_cast<uint32_t>(std::min<uint64_t>(maxUs, policy.maxBufferTimeUs));

    if (clampedMin > clampedMax)
    {
        DEBUGPRINT("%s: buffer time bounds %u..%u us hold no whole millisecond", config.name.c_str(), min, max);
        return false;
    }

    window.minUs = clampedMin;
    window.maxUs = clampedMax;
    return true;
}

uint32_t getDefaultBufferTimeMs(const BufferWindow& window)
{
    return std::max(window.maxUs / 2, window.minUs) / ASOUND_PROBE_US_PER_MS;
}

uint32_t getPeriodTimeUs(const ProbePolicy& policy, const uint32_t bufferTimeMs)
{
    const uint32_t bufferTimeUs = bufferTimeMs * ASOUND_PROBE_US_PER_MS;

    return policy.periodsPerBuffer != 0 ? bufferTimeUs / policy.periodsPerBuffer : bufferTimeUs;
}

void probeBufferTimes(const ProbePolicy& policy, const ValidConfiguration& config, std::vector<uint32_t>& bufferTimesMs)
{
    BufferWindow window;

    if (config.bufferTimeMaxUs != 0)
        window = { config.bufferTimeMinUs, config.bufferTimeMaxUs };
    else
        queryBufferWindow(policy, config, window);

    bufferTimesMs.clear();

    ProbeTrial trial = makeConfigurationTrial(config);

    for (uint64_t bufferTimeUs = window.minUs; bufferTimeUs <= window.maxUs; bufferTimeUs += ASOUND_PROBE_US_PER_MS)
    {
        const uint32_t bufferTimeMs = static_cast<uint32_t>(bufferTimeUs / ASOUND_PROBE_US_PER_MS);

        trial.bufferTimeUs = static_cast<uint32_t>(bufferTimeUs);
        trial.periodTimeUs = getPeriodTimeUs(policy, bufferTimeMs);

        if (runProbeTrial(config.name.c_str(), config.playback, trial, true))
            bufferTimesMs.push_back(bufferTimeMs);
    }

    DEBUGPRINT("%s: %zu buffer times in %u..%u us",
               config.name.c_str(), bufferTimesMs.size(), window.minUs, window.maxUs);
}

uint32_t snapBufferTime(const std::vector<uint32_t>& bufferTimesMs, const uint32_t requestedMs)
{
    uint32_t ret = requestedMs;
    uint32_t bestDistance = UINT32_MAX;

    for (const uint32_t value : bufferTimesMs)
    {
        const uint32_t distance = value > requestedMs ? value - requestedMs : requestedMs - value;

        if (distance < bestDistance || (distance == bestDistance && value < ret))
        {
            ret = value;
            bestDistance = distance;
        }
    }

    return ret;
}

uint32_t chooseBufferTime(const ProbePolicy& policy, const ValidConfiguration& config, const uint32_t requestedMs)
{
    uint32_t defaultMs = config.bufferTimeMs;

    if (defaultMs == 0)
    {
        BufferWindow window;
        queryBufferWindow(policy, config, window);
        defaultMs = getDefaultBufferTimeMs(window);
    }

    std::vector<uint32_t> bufferTimesMs;
    probeBufferTimes(policy, config, bufferTimesMs);

    if (bufferTimesMs.empty())
    {
        WARNPRINT("%s: No available Buffer Times were reported, falling back to %u milliseconds.",
                  config.name.c_str(), defaultMs);
        return defaultMs;
    }

    return snapBufferTime(bufferTimesMs, requestedMs != 0 ? requestedMs : defaultMs);
}

// --------------------------------------------------------------------------------------------------------------------
