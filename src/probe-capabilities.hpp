// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-policy.hpp"
#include "probe-backend.hpp"

// --------------------------------------------------------------------------------------------------------------------

// Linear scan over [min, max] of one parameter kind, one fresh session per value.
// If the scan accepts `policy.maxEnumeratedValues` values the device is converting internally:
// the scan result is thrown away, only `fallback` values inside [min, max] are tried and false is returned.
bool scanCapabilityRange(const ProbePolicy& policy,
                         const ProbeEndpoint& endpoint,
                         ProbeParam param,
                         uint32_t min,
                         uint32_t max,
                         const std::vector<uint32_t>& fallback,
                         std::vector<uint32_t>& values);

// Fill endpoint identity, flags and capabilities.
// Returns false if the endpoint can't be opened or accepts nothing usable.
bool probeCapabilities(const ProbePolicy& policy, ProbeEndpoint& endpoint);

// --------------------------------------------------------------------------------------------------------------------
