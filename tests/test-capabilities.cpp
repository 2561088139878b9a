// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#undef NDEBUG
#include <cassert>

#include "probe-backend-mock.hpp"
#include "probe-capabilities.hpp"

#include <iterator>

static ProbeEndpoint make_endpoint(const std::string& name, const bool playback = true)
{
    ProbeEndpoint endpoint;
    endpoint.name = name;
    endpoint.description = "Hint Description";
    endpoint.cardKey = "PCH";
    endpoint.playback = playback;
    return endpoint;
}

static void test_exact_sets()
{
    resetMockBackend();
    addMockDevice(makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat32, kSampleFormat16 }, { 44100, 48000 }, { 2 }));

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));

    // policy order, not device order
    assert(endpoint.caps.formats.size() == 2);
    assert(endpoint.caps.formats[0] == kSampleFormat16);
    assert(endpoint.caps.formats[1] == kSampleFormat32);
    assert(endpoint.caps.rates == std::vector<uint32_t>({ 44100, 48000 }));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 2 }));

    assert(endpoint.isRealHardware);
    assert(endpoint.softwareMixable);
    assert(! endpoint.hasBuiltinMixer);
    assert(endpoint.description == "Mock PCM");
}

static void test_no_mixable_format()
{
    resetMockBackend();
    addMockDevice(makeMockDevice("hw:CARD=PCH,DEV=0", {}, { 48000 }, { 2 }));

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(! probeCapabilities(policy, endpoint));
    assert(! endpoint.softwareMixable);
    assert(endpoint.caps.formats.empty());
}

static void test_fake_rate_range()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, {}, { 2 });
    device.rateRange = true;
    device.rateMin = 4000;
    device.rateMax = 1000000;
    addMockDevice(device);

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));

    assert(! endpoint.isRealHardware);
    assert(endpoint.caps.rates == std::vector<uint32_t>(std::begin(kFallbackRatesToTry), std::end(kFallbackRatesToTry)));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 2 }));
}

static void test_fake_range_keeps_accepted_fallbacks()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, {}, {});
    device.rateRange = true;
    device.rateMin = 44100;
    device.rateMax = 96000;
    device.channelRange = true;
    device.channelMin = 1;
    device.channelMax = 255;
    addMockDevice(device);

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));

    assert(! endpoint.isRealHardware);
    assert(endpoint.caps.rates == std::vector<uint32_t>({ 44100, 48000, 64000, 88200, 96000 }));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12 }));
}

static void test_fallback_inside_policy_bounds()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, {}, {});
    device.rateRange = true;
    device.rateMin = 4000;
    device.rateMax = 1000000;
    device.channelRange = true;
    device.channelMin = 1;
    device.channelMax = 255;
    addMockDevice(device);

    ProbePolicy policy;
    policy.minRate = 11025;
    policy.maxRate = 192000;
    policy.minChannels = 2;
    policy.maxChannels = 8;
    policy.maxEnumeratedValues = 4;

    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));
    assert(! endpoint.isRealHardware);

    assert(endpoint.caps.rates == std::vector<uint32_t>({ 11025, 16000, 22050, 32000, 44100, 48000,
                                                          64000, 88200, 96000, 176400, 192000 }));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 2, 3, 4, 5, 6, 7, 8 }));

    for (const uint32_t rate : endpoint.caps.rates)
        assert(rate >= policy.minRate && rate <= policy.maxRate);
}

static void test_ceiling()
{
    resetMockBackend();
    addMockDevice(makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, { 8000, 9000, 10000 }, { 1, 2, 3, 4 }));

    ProbePolicy policy;
    policy.maxEnumeratedValues = 4;

    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));

    // three rates stay below the ceiling, four channel counts reach it
    assert(endpoint.caps.rates == std::vector<uint32_t>({ 8000, 9000, 10000 }));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 1, 2, 3, 4 }));
    assert(! endpoint.isRealHardware);

    std::vector<uint32_t> values;
    assert(scanCapabilityRange(policy, endpoint, kProbeParamRate, 8000, 10000, policy.fallbackRates, values));
    assert(values.size() == 3);
    assert(! scanCapabilityRange(policy, endpoint, kProbeParamChannels, 1, 8, policy.fallbackChannels, values));
    assert(values == std::vector<uint32_t>({ 1, 2, 3, 4 }));
}

static void test_bounds_failure()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, { 44100 }, { 2 });
    device.boundsFail = true;
    addMockDevice(device);

    ProbePolicy policy;
    policy.maxRate = 50000;

    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0");
    assert(probeCapabilities(policy, endpoint));
    assert(endpoint.caps.rates == std::vector<uint32_t>({ 44100 }));
    assert(endpoint.caps.channels == std::vector<uint32_t>({ 2 }));
    assert(endpoint.isRealHardware);
}

static void test_identity()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=3", { kSampleFormat16 }, { 48000 }, { 2 });
    device.description = "";
    device.deviceNumber = 3;
    device.subDeviceNumber = 1;
    device.subDeviceCount = 4;
    addMockDevice(device);

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=3");
    assert(probeCapabilities(policy, endpoint));
    assert(endpoint.description == "Hint Description");
    assert(endpoint.deviceNumber == 3);
    assert(endpoint.subDeviceNumber == 1);
    assert(endpoint.hasBuiltinMixer);

    endpoint = make_endpoint("hw:CARD=PCH,DEV=3");
    endpoint.description.clear();
    assert(probeCapabilities(policy, endpoint));
    assert(endpoint.description == "NONE");
}

static void test_unopenable()
{
    resetMockBackend();

    MockDevice device = makeMockDevice("hw:CARD=PCH,DEV=0", { kSampleFormat16 }, { 48000 }, { 2 });
    device.canCapture = false;
    addMockDevice(device);

    const ProbePolicy policy;
    ProbeEndpoint endpoint = make_endpoint("hw:CARD=PCH,DEV=0", false);
    assert(! probeCapabilities(policy, endpoint));

    endpoint = make_endpoint("hw:CARD=PCH,DEV=9");
    assert(! probeCapabilities(policy, endpoint));

    assert(getMockBackendStats().poisonedReuse == 0);
}

int main()
{
    test_exact_sets();
    test_no_mixable_format();
    test_fake_rate_range();
    test_fake_range_keeps_accepted_fallbacks();
    test_fallback_inside_policy_bounds();
    test_ceiling();
    test_bounds_failure();
    test_identity();
    test_unopenable();
    return 0;
}
