// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-policy.hpp"

// --------------------------------------------------------------------------------------------------------------------

// Verify which (format, rate, channels) triples of the endpoint's capabilities fully commit.
// Pruned per level: format alone, then format+rate, then format+rate+channels, each on a fresh session.
// Results are written in capability order.
void searchConfigurations(const ProbePolicy& policy,
                          const ProbeEndpoint& endpoint,
                          std::vector<ValidConfiguration>& configs);

// Rebuild the endpoint capabilities as the projection of its configurations, keeping capability order.
// Returns false if there are no configurations.
bool filterCapabilities(ProbeEndpoint& endpoint);

// first configuration with the given rate and channels (0 matches any), null if there is none
const ValidConfiguration* findConfiguration(const ProbeEndpoint& endpoint, uint32_t rate, uint32_t channels);

// Capabilities, configuration search, filtering and (if enabled in policy) buffer windows for one endpoint.
// Returns false if the endpoint ends up with no valid configuration.
bool probeEndpoint(const ProbePolicy& policy,
                   const std::string& name,
                   const std::string& description,
                   const std::string& cardKey,
                   bool playback,
                   ProbeEndpoint& endpoint);

// --------------------------------------------------------------------------------------------------------------------
