// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-policy.hpp"

// --------------------------------------------------------------------------------------------------------------------

struct EndpointCandidate {
    std::string name;
    std::string description;
    std::string cardKey;
    bool playback;
};

// physical card a device name belongs to, "hw:CARD=PCH,DEV=0" -> "PCH"
std::string getCardKey(const std::string& name);

bool isHardwareEndpointName(const ProbePolicy& policy, const std::string& name);

// hardware-class endpoints from the system hints, one per direction
// an unavailable hint source leaves the list empty
void enumerateEndpointCandidates(const ProbePolicy& policy, std::vector<EndpointCandidate>& candidates);

// Full discovery pass: enumerate, probe every card in parallel, collect the results.
// Sets up the backend first, call cleanupProbeBackend once the results are no longer probed further.
void discoverEndpoints(const ProbePolicy& policy, ProbeResults& results);

// --------------------------------------------------------------------------------------------------------------------
