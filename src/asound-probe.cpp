// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-backend.hpp"
#include "probe-buffer.hpp"
#include "probe-discovery.hpp"
#include "probe-search.hpp"

#include <cstdlib>
#include <cstring>

// --------------------------------------------------------------------------------------------------------------------

static void printUsage(const char* const argv0)
{
    fprintf(stderr, "usage: %s [--playback] [--capture] [--max-values N]\n"
                    "       [--buffer-times [--rate N] [--channels N] [--buffer-time MS]]\n", argv0);
}

static bool parseNumber(const char* const arg, const char* const value, uint32_t& ret)
{
    const int number = std::atoi(value);

    if (number <= 0)
    {
        fprintf(stderr, "invalid value for %s: %s\n", arg, value);
        return false;
    }

    ret = static_cast<uint32_t>(number);
    return true;
}

static void printValues(const char* const label, const std::vector<uint32_t>& values)
{
    printf("    %s:", label);
    for (const uint32_t value : values)
        printf(" %u", value);
    printf("\n");
}

// what to do with the configurations once listed, 0 means no preference
struct BufferTimeRequest {
    uint32_t rate = 0;
    uint32_t channels = 0;
    uint32_t bufferTimeMs = 0;
};

static void printEndpoint(const ProbePolicy& policy, const BufferTimeRequest& request, const ProbeEndpoint& endpoint)
{
    printf("%s | card %s | dev %u,%u | %s%s%s\n",
           endpoint.name.c_str(),
           endpoint.cardKey.c_str(),
           endpoint.deviceNumber,
           endpoint.subDeviceNumber,
           endpoint.description.c_str(),
           endpoint.isRealHardware ? "" : " | converting",
           endpoint.hasBuiltinMixer ? " | hw mixer" : "");

    printf("    formats:");
    for (const SampleFormat format : endpoint.caps.formats)
        printf(" %s", getSampleFormatName(format));
    printf("\n");

    printValues("rates", endpoint.caps.rates);
    printValues("channels", endpoint.caps.channels);
    printf("    configurations: %zu\n", endpoint.configs.size());

    if (! policy.probeBufferWindows)
        return;

    for (const ValidConfiguration& config : endpoint.configs)
        printf("    %s %uHz %uch | buffer %u..%u us, default %u ms\n",
               getSampleFormatName(config.format), config.rate, config.channels,
               config.bufferTimeMinUs, config.bufferTimeMaxUs, config.bufferTimeMs);

    // only the selected configuration gets the full buffer time scan
    const ValidConfiguration* const config = findConfiguration(endpoint, request.rate, request.channels);

    if (config == nullptr)
    {
        printf("    no configuration matches the requested rate and channels\n");
        return;
    }

    const uint32_t bufferTimeMs = chooseBufferTime(policy, *config, request.bufferTimeMs);

    printf("    selected %s %uHz %uch | buffer time %u ms, period time %u us\n",
           getSampleFormatName(config->format), config->rate, config->channels,
           bufferTimeMs, getPeriodTimeUs(policy, bufferTimeMs));
}

// --------------------------------------------------------------------------------------------------------------------

int main(int argc, const char* argv[])
{
    ProbePolicy policy;
    BufferTimeRequest request;
    bool playbackOnly = false;
    bool captureOnly = false;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--playback") == 0)
        {
            playbackOnly = true;
        }
        else if (std::strcmp(argv[i], "--capture") == 0)
        {
            captureOnly = true;
        }
        else if (std::strcmp(argv[i], "--buffer-times") == 0)
        {
            policy.probeBufferWindows = true;
        }
        else if (std::strcmp(argv[i], "--max-values") == 0 && i + 1 < argc)
        {
            if (! parseNumber(argv[i], argv[i + 1], policy.maxEnumeratedValues))
                return 1;
            ++i;
        }
        else if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc)
        {
            if (! parseNumber(argv[i], argv[i + 1], request.rate))
                return 1;
            ++i;
        }
        else if (std::strcmp(argv[i], "--channels") == 0 && i + 1 < argc)
        {
            if (! parseNumber(argv[i], argv[i + 1], request.channels))
                return 1;
            ++i;
        }
        else if (std::strcmp(argv[i], "--buffer-time") == 0 && i + 1 < argc)
        {
            if (! parseNumber(argv[i], argv[i + 1], request.bufferTimeMs))
                return 1;
            ++i;
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            printUsage(argv[0]);
            return 1;
        }
    }

    // neither or both flags given means both directions
    if (playbackOnly != captureOnly)
    {
        policy.probePlayback = playbackOnly;
        policy.probeCapture = captureOnly;
    }

    ProbeResults results;
    discoverEndpoints(policy, results);

    if (policy.probePlayback)
    {
        printf("Playback Devices:\n");
        for (const ProbeEndpoint& endpoint : results.playback)
            printEndpoint(policy, request, endpoint);
    }

    if (policy.probeCapture)
    {
        printf("Capture Devices:\n");
        for (const ProbeEndpoint& endpoint : results.capture)
            printEndpoint(policy, request, endpoint);
    }

    cleanupProbeBackend();
    return 0;
}

// --------------------------------------------------------------------------------------------------------------------
