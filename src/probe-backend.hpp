// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// --------------------------------------------------------------------------------------------------------------------
// negotiation backend, implemented once per build (alsa for the tool, an in-memory mock for tests)

struct DeviceHint {
    std::string name;
    std::string description;
    // "Input", "Output" or empty for duplex devices
    std::string ioid;
};

enum ProbeParam {
    kProbeParamFormat = 0,
    kProbeParamRate,
    kProbeParamChannels,
    kProbeParamBufferTime,
    kProbeParamPeriodTime
};

struct ProbeDeviceInfo {
    std::string description;
    uint32_t deviceNumber = 0;
    uint32_t subDeviceNumber = 0;
    uint32_t subDeviceCount = 1;
};

// one open device plus its parameter object
// single-use: after any rejected parameter or a commit it refuses everything
struct ProbeSession;

// list pcm hints from the system, returns false if the hint source is unavailable
bool enumerateProbeHints(std::vector<DeviceHint>& hints);

// open a fresh session with resampling disabled, returns null on failure
ProbeSession* openProbeSession(const char* deviceID, bool playback);
void closeProbeSession(ProbeSession* session);

bool getProbeSessionInfo(ProbeSession* session, ProbeDeviceInfo& info);

// query current bounds of a parameter kind (not valid for kProbeParamFormat)
bool queryProbeSessionBounds(ProbeSession* session, ProbeParam param, uint32_t& min, uint32_t& max);

// request an exact value and read it back, a rejected or changed value poisons the session
// formats are passed as SampleFormat values
bool setProbeSessionParam(ProbeSession* session, ProbeParam param, uint32_t value);

// apply all requested parameters to the device
bool commitProbeSession(ProbeSession* session);

// Global backend setup (silences library error output), call from the dispatching thread
// before any worker starts. Safe to call more than once.
void initProbeBackend();

// undo initProbeBackend and release global backend caches, call once after all probing is done
void cleanupProbeBackend();

// --------------------------------------------------------------------------------------------------------------------
