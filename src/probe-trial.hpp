// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-backend.hpp"
#include "probe-types.hpp"

// --------------------------------------------------------------------------------------------------------------------

// parameters requested together on one fresh session
// zero/invalid fields are not requested, the rest is applied in declaration order
struct ProbeTrial {
    SampleFormat format = kSampleFormatInvalid;
    uint32_t rate = 0;
    uint32_t channels = 0;
    uint32_t bufferTimeUs = 0;
    uint32_t periodTimeUs = 0;
};

// It's all or nothing with negotiation sessions, once a parameter is rejected they can't be reused.
// So each of these opens a session from scratch and closes it before returning.

// true if every requested parameter is accepted as-is (and, if asked, the whole set commits)
bool runProbeTrial(const char* deviceID, bool playback, const ProbeTrial& trial, bool commit);

// bounds of `param` after applying `prefix`
bool queryProbeTrialBounds(const char* deviceID, bool playback, const ProbeTrial& prefix,
                           ProbeParam param, uint32_t& min, uint32_t& max);

bool readProbeDeviceInfo(const char* deviceID, bool playback, ProbeDeviceInfo& info);

// --------------------------------------------------------------------------------------------------------------------
