// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-trial.hpp"

#include <memory>

// --------------------------------------------------------------------------------------------------------------------

typedef std::unique_ptr<ProbeSession, void(*)(ProbeSession*)> ScopedProbeSession;

static ScopedProbeSession openScopedProbeSession(const char* const deviceID, const bool playback)
{
    return ScopedProbeSession(openProbeSession(deviceID, playback), closeProbeSession);
}

static bool applyProbeTrial(ProbeSession* const session, const ProbeTrial& trial)
{
    if (trial.format != kSampleFormatInvalid && ! setProbeSessionParam(session, kProbeParamFormat, trial.format))
        return false;
    if (trial.rate != 0 && ! setProbeSessionParam(session, kProbeParamRate, trial.rate))
        return false;
    if (trial.channels != 0 && ! setProbeSessionParam(session, kProbeParamChannels, trial.channels))
        return false;
    if (trial.bufferTimeUs != 0 && ! setProbeSessionParam(session, kProbeParamBufferTime, trial.bufferTimeUs))
        return false;
    if (trial.periodTimeUs != 0 && ! setProbeSessionParam(session, kProbeParamPeriodTime, trial.periodTimeUs))
        return false;

    return true;
}

// --------------------------------------------------------------------------------------------------------------------

bool runProbeTrial(const char* const deviceID, const bool playback, const ProbeTrial& trial, const bool commit)
{
    const ScopedProbeSession session = openScopedProbeSession(deviceID, playback);

    if (session == nullptr)
        return false;

    if (! applyProbeTrial(session.get(), trial))
        return false;

    return ! commit || commitProbeSession(session.get());
}

bool queryProbeTrialBounds(const char* const deviceID,
                           const bool playback,
                           const ProbeTrial& prefix,
                           const ProbeParam param,
                           uint32_t& min,
                           uint32_t& max)
{
    const ScopedProbeSession session = openScopedProbeSession(deviceID, playback);

    if (session == nullptr)
        return false;

    if (! applyProbeTrial(session.get(), prefix))
        return false;

    return queryProbeSessionBounds(session.get(), param, min, max);
}

bool readProbeDeviceInfo(const char* const deviceID, const bool playback, ProbeDeviceInfo& info)
{
    const ScopedProbeSession session = openScopedProbeSession(deviceID, playback);

    if (session == nullptr)
        return false;

    return getProbeSessionInfo(session.get(), info);
}

// --------------------------------------------------------------------------------------------------------------------
