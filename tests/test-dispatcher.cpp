// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#undef NDEBUG
#include <cassert>

#include "probe-backend-mock.hpp"
#include "probe-discovery.hpp"
#include "probe-dispatcher.hpp"
#include "probe-search.hpp"

#include <unistd.h>

static void add_device(const std::string& name, const std::string& ioid = "", const bool throwOnOpen = false)
{
    MockDevice device = makeMockDevice(name, { kSampleFormat16, kSampleFormat32 }, { 48000 }, { 1, 2 });
    device.ioid = ioid;
    device.throwOnOpen = throwOnOpen;
    device.openDelayUs = 50;
    addMockDevice(device);
}

static bool has_endpoint(const std::vector<ProbeEndpoint>& endpoints, const std::string& name)
{
    for (const ProbeEndpoint& endpoint : endpoints)
    {
        if (endpoint.name == name)
            return true;
    }

    return false;
}

static void test_one_thread_per_card()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0");
    add_device("hw:CARD=PCH,DEV=1", "Output");
    add_device("hw:CARD=PCH,DEV=2", "Input");
    add_device("hdmi:CARD=NVidia,DEV=0", "Output");
    add_device("hdmi:CARD=NVidia,DEV=1", "Output");
    add_device("hw:CARD=USB,DEV=0");

    const ProbePolicy policy;
    ProbeResults results;
    discoverEndpoints(policy, results);

    assert(results.playback.size() == 5);
    assert(results.capture.size() == 3);
    assert(has_endpoint(results.playback, "hw:CARD=PCH,DEV=1"));
    assert(! has_endpoint(results.capture, "hw:CARD=PCH,DEV=1"));
    assert(has_endpoint(results.capture, "hw:CARD=PCH,DEV=2"));
    assert(has_endpoint(results.capture, "hw:CARD=USB,DEV=0"));

    for (const ProbeEndpoint& endpoint : results.playback)
    {
        assert(endpoint.playback);
        assert(endpoint.configs.size() == 4);
    }
    for (const ProbeEndpoint& endpoint : results.capture)
        assert(! endpoint.playback);

    const MockBackendStats stats = getMockBackendStats();
    assert(stats.overlapViolations == 0);
    assert(stats.poisonedReuse == 0);
    assert(stats.sessionsOpenedBeforeInit == 0);
    assert(stats.initsFromOtherThreads == 0);
    assert(stats.cardThreads.size() == 3);

    for (const auto& entry : stats.cardThreads)
        assert(entry.second.size() == 1);

    assert(! pthread_equal(stats.cardThreads.at("PCH")[0], stats.cardThreads.at("NVidia")[0]));
    assert(! pthread_equal(stats.cardThreads.at("PCH")[0], stats.cardThreads.at("USB")[0]));
    assert(! pthread_equal(stats.cardThreads.at("NVidia")[0], stats.cardThreads.at("USB")[0]));
}

static void test_repeatable()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0");
    add_device("hdmi:CARD=NVidia,DEV=3", "Output");
    add_device("hw:CARD=USB,DEV=0", "Input");

    const ProbePolicy policy;
    ProbeResults first, second;
    discoverEndpoints(policy, first);
    discoverEndpoints(policy, second);

    assert(first.playback.size() == second.playback.size());
    assert(first.capture.size() == second.capture.size());

    for (size_t i = 0; i < first.playback.size(); ++i)
    {
        assert(first.playback[i].name == second.playback[i].name);
        assert(first.playback[i].caps.rates == second.playback[i].caps.rates);
        assert(first.playback[i].configs.size() == second.playback[i].configs.size());
    }

    for (size_t i = 0; i < first.capture.size(); ++i)
        assert(first.capture[i].name == second.capture[i].name);
}

static void test_replaces_dead_worker()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0", "", true);
    add_device("hw:CARD=PCH,DEV=1");

    const ProbePolicy policy;
    ProbeDispatcher* const dispatcher = initProbeDispatcher(policy);

    assert(addProbeDispatcherJob(dispatcher, "hw:CARD=PCH,DEV=0", "", true));
    assert(dispatcher->workers.size() == 1);

    ProbeWorker* const deadWorker = dispatcher->workers["PCH"];
    while (isProbeWorkerRunning(deadWorker))
        usleep(1000);

    assert(addProbeDispatcherJob(dispatcher, "hw:CARD=PCH,DEV=1", "", true));
    assert(dispatcher->workers.size() == 1);
    assert(isProbeWorkerRunning(dispatcher->workers["PCH"]));

    ProbeResults results;
    finalizeProbeDispatcher(dispatcher, results);
    closeProbeDispatcher(dispatcher);

    assert(results.playback.size() == 1);
    assert(results.playback[0].name == "hw:CARD=PCH,DEV=1");
    assert(results.capture.empty());
}

static void test_lost_worker()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0", "Output");
    add_device("hw:CARD=PCH,DEV=1", "Output", true);
    add_device("hw:CARD=USB,DEV=0", "Output");

    const ProbePolicy policy;
    ProbeResults results;
    discoverEndpoints(policy, results);

    // everything of the faulty card is gone, the other card is unaffected
    assert(results.playback.size() == 1);
    assert(results.playback[0].name == "hw:CARD=USB,DEV=0");
    assert(results.capture.empty());
}

static void test_close_without_finalize()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0");

    const ProbePolicy policy;
    ProbeDispatcher* const dispatcher = initProbeDispatcher(policy);
    assert(addProbeDispatcherJob(dispatcher, "hw:CARD=PCH,DEV=0", "", true));
    assert(addProbeDispatcherJob(dispatcher, "hw:CARD=PCH,DEV=0", "", false));
    closeProbeDispatcher(dispatcher);

    assert(getMockBackendStats().overlapViolations == 0);
}

static void test_backend_set_up_before_workers()
{
    resetMockBackend();
    add_device("hw:CARD=PCH,DEV=0");
    add_device("hw:CARD=USB,DEV=0");
    add_device("hdmi:CARD=NVidia,DEV=0", "Output");

    const ProbePolicy policy;
    ProbeResults results;
    discoverEndpoints(policy, results);
    assert(results.playback.size() == 3);

    MockBackendStats stats = getMockBackendStats();
    assert(stats.sessionsOpened != 0);
    assert(stats.sessionsOpenedBeforeInit == 0);
    assert(stats.initsFromOtherThreads == 0);

    // the backend stays set up for follow-up probing until cleaned up
    ProbeEndpoint endpoint;
    assert(probeEndpoint(policy, "hw:CARD=PCH,DEV=0", "", "PCH", true, endpoint));
    assert(getMockBackendStats().sessionsOpenedBeforeInit == 0);

    cleanupProbeBackend();
    assert(probeEndpoint(policy, "hw:CARD=PCH,DEV=0", "", "PCH", true, endpoint));
    assert(getMockBackendStats().sessionsOpenedBeforeInit != 0);
}

int main()
{
    test_one_thread_per_card();
    test_repeatable();
    test_replaces_dead_worker();
    test_lost_worker();
    test_close_without_finalize();
    test_backend_set_up_before_workers();
    return 0;
}
