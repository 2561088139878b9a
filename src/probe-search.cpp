// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-search.hpp"
#include "probe-buffer.hpp"
#include "probe-capabilities.hpp"
#include "probe-trial.hpp"

#include <set>

// --------------------------------------------------------------------------------------------------------------------

static ValidConfiguration makeValidConfiguration(const ProbeEndpoint& endpoint, const ProbeTrial& trial)
{
    ValidConfiguration config;
    config.name = endpoint.name;
    config.cardKey = endpoint.cardKey;
    config.deviceNumber = endpoint.deviceNumber;
    config.subDeviceNumber = endpoint.subDeviceNumber;
    config.playback = endpoint.playback;
    config.isRealHardware = endpoint.isRealHardware;
    config.format = trial.format;
    config.rate = trial.rate;
    config.channels = trial.channels;
    return config;
}

template <typename T>
static void filterValues(std::vector<T>& values, const std::set<T>& used)
{
    std::vector<T> filtered;

    for (const T& value : values)
    {
        if (used.count(value) != 0)
            filtered.push_back(value);
    }

    values.swap(filtered);
}

// --------------------------------------------------------------------------------------------------------------------

void searchConfigurations(const ProbePolicy&, const ProbeEndpoint& endpoint, std::vector<ValidConfiguration>& configs)
{
    const char* const name = endpoint.name.c_str();
    const CapabilitySet& caps = endpoint.caps;

    configs.clear();

    for (const SampleFormat format : caps.formats)
    {
        ProbeTrial trial;
        trial.format = format;

        if (! runProbeTrial(name, endpoint.playback, trial, true))
            continue;

        for (const uint32_t rate : caps.rates)
        {
            trial.rate = rate;
            trial.channels = 0;

            if (! runProbeTrial(name, endpoint.playback, trial, true))
                continue;

            for (const uint32_t channels : caps.channels)
            {
                trial.channels = channels;

                if (runProbeTrial(name, endpoint.playback, trial, true))
                    configs.push_back(makeValidConfiguration(endpoint, trial));
            }
        }
    }

    DEBUGPRINT("%s: %zu valid configurations", name, configs.size());
}

bool filterCapabilities(ProbeEndpoint& endpoint)
{
    if (endpoint.configs.empty())
    {
        endpoint.caps = CapabilitySet();
        return false;
    }

    std::set<SampleFormat> formats;
    std::set<uint32_t> rates, channels;

    for (const ValidConfiguration& config : endpoint.configs)
    {
        formats.insert(config.format);
        rates.insert(config.rate);
        channels.insert(config.channels);
    }

    filterValues(endpoint.caps.formats, formats);
    filterValues(endpoint.caps.rates, rates);
    filterValues(endpoint.caps.channels, channels);
    return true;
}

const ValidConfiguration* findConfiguration(const ProbeEndpoint& endpoint, const uint32_t rate, const uint32_t channels)
{
    for (const ValidConfiguration& config : endpoint.configs)
    {
        if (rate != 0 && config.rate != rate)
            continue;
        if (channels != 0 && config.channels != channels)
            continue;
        return &config;
    }

    return nullptr;
}

bool probeEndpoint(const ProbePolicy& policy,
                   const std::string& name,
                   const std::string& description,
                   const std::string& cardKey,
                   const bool playback,
                   ProbeEndpoint& endpoint)
{
    endpoint = ProbeEndpoint();
    endpoint.name = name;
    endpoint.description = description;
    endpoint.cardKey = cardKey;
    endpoint.playback = playback;

    if (! probeCapabilities(policy, endpoint))
        return false;

    std::vector<ValidConfiguration> configs;
    searchConfigurations(policy, endpoint, configs);

    if (policy.probeBufferWindows)
    {
        for (ValidConfiguration& config : configs)
        {
            BufferWindow window;
            queryBufferWindow(policy, config, window);

            config.bufferTimeMinUs = window.minUs;
            config.bufferTimeMaxUs = window.maxUs;
            config.bufferTimeMs = getDefaultBufferTimeMs(window);
        }
    }

    endpoint.configs.swap(configs);

    if (! filterCapabilities(endpoint))
    {
        WARNPRINT("%s has no valid configurations, and will be ignored.", name.c_str());
        return false;
    }

    return true;
}

// --------------------------------------------------------------------------------------------------------------------
