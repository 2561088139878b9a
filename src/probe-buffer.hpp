// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-policy.hpp"

// --------------------------------------------------------------------------------------------------------------------

// buffer time window in microseconds, both ends on whole milliseconds
struct BufferWindow {
    uint32_t minUs;
    uint32_t maxUs;
};

// Query the buffer time bounds for a verified configuration.
// On any failure the policy's default window is used and false is returned.
bool queryBufferWindow(const ProbePolicy& policy, const ValidConfiguration& config, BufferWindow& window);

// half the window's maximum, at least its minimum, in whole milliseconds
uint32_t getDefaultBufferTimeMs(const BufferWindow& window);

// period time that goes together with a buffer time
uint32_t getPeriodTimeUs(const ProbePolicy& policy, uint32_t bufferTimeMs);

// Every buffer time (1ms steps) that fully applies together with its derived period time.
// Uses the window stored in `config` if there is one, queries it otherwise.
void probeBufferTimes(const ProbePolicy& policy, const ValidConfiguration& config, std::vector<uint32_t>& bufferTimesMs);

// available value nearest to `requestedMs`, ties go to the smaller one
uint32_t snapBufferTime(const std::vector<uint32_t>& bufferTimesMs, uint32_t requestedMs);

// Probe the buffer times and pick one, 0 as `requestedMs` means the default recommendation.
// Falls back to the default recommendation with a warning if nothing was accepted.
uint32_t chooseBufferTime(const ProbePolicy& policy, const ValidConfiguration& config, uint32_t requestedMs);

// --------------------------------------------------------------------------------------------------------------------
