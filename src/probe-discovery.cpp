// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-discovery.hpp"
#include "probe-backend.hpp"
#include "probe-dispatcher.hpp"

#include <cctype>

// --------------------------------------------------------------------------------------------------------------------

static std::string trim(const std::string& s)
{
    size_t start = 0, end = s.size();

    while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;

    return s.substr(start, end - start);
}

// hint descriptions come as "Card Name\nDevice Name"
static std::string foldDescription(const std::string& description)
{
    std::string ret;

    for (const char c : description)
    {
        if (c == '\n')
            ret += ", ";
        else
            ret += c;
    }

    return ret;
}

// --------------------------------------------------------------------------------------------------------------------

std::string getCardKey(const std::string& name)
{
    const size_t eq = name.find('=');
    size_t start = eq != std::string::npos ? eq + 1 : 0;
    size_t end = name.find(',');

    if (end == std::string::npos)
        end = name.size();

    // "hw:0,DEV=1" style names have no card assignment before the comma
    if (end < start)
        start = 0;

    return trim(name.substr(start, end - start));
}

bool isHardwareEndpointName(const ProbePolicy& policy, const std::string& name)
{
    for (const std::string& prefix : policy.hintPrefixes)
    {
        if (name.compare(0, prefix.size(), prefix) == 0)
            return true;
    }

    return false;
}

void enumerateEndpointCandidates(const ProbePolicy& policy, std::vector<EndpointCandidate>& candidates)
{
    std::vector<DeviceHint> hints;

    if (! enumerateProbeHints(hints))
    {
        DEBUGPRINT("no device hints available");
        return;
    }

    for (const DeviceHint& hint : hints)
    {
        if (! isHardwareEndpointName(policy, hint.name))
            continue;

        EndpointCandidate candidate;
        candidate.name = hint.name;
        candidate.description = foldDescription(hint.description);
        candidate.cardKey = getCardKey(hint.name);

        // no IOID means the device does both directions
        const bool playback = hint.ioid.empty() || hint.ioid == "Output";
        const bool capture = hint.ioid.empty() || hint.ioid == "Input";

        if (playback && policy.probePlayback)
        {
            candidate.playback = true;
            candidates.push_back(candidate);
        }

        if (capture && policy.probeCapture)
        {
            candidate.playback = false;
            candidates.push_back(candidate);
        }
    }

    DEBUGPRINT("%zu hints, %zu hardware endpoint candidates", hints.size(), candidates.size());
}

void discoverEndpoints(const ProbePolicy& policy, ProbeResults& results)
{
    std::vector<EndpointCandidate> candidates;
    enumerateEndpointCandidates(policy, candidates);

    initProbeBackend();

    ProbeDispatcher* const dispatcher = initProbeDispatcher(policy);

    for (const EndpointCandidate& candidate : candidates)
        addProbeDispatcherJob(dispatcher, candidate.name, candidate.description, candidate.playback);

    finalizeProbeDispatcher(dispatcher, results);
    closeProbeDispatcher(dispatcher);
}

// --------------------------------------------------------------------------------------------------------------------
