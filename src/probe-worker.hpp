// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-policy.hpp"

// --------------------------------------------------------------------------------------------------------------------

enum ProbeJobType {
    kProbeJobGetDevice = 0,
    kProbeJobDone
};

struct ProbeJob {
    ProbeJobType type;
    std::string name;
    std::string description;
    std::string cardKey;
    bool playback;
};

// One thread per physical card, probing its endpoints one after the other.
// Only the dispatching thread calls the functions below.
struct ProbeWorker;

// start a worker thread for `cardKey`, returns null on failure
ProbeWorker* initProbeWorker(const std::string& cardKey, const ProbePolicy& policy);

// queue a GetDevice job, returns false if the worker no longer accepts jobs
bool addProbeWorkerJob(ProbeWorker* worker, const std::string& name, const std::string& description, bool playback);

// false once the worker thread has returned, normally or after a fault
bool isProbeWorkerRunning(ProbeWorker* worker);

// Send Done, wait for the queue to drain and append the accumulated endpoints to `results`.
// Returns false (and appends nothing) if the worker thread was lost.
bool finishProbeWorker(ProbeWorker* worker, ProbeResults& results);

// stop (if still running), join and free the worker
void closeProbeWorker(ProbeWorker* worker);

// --------------------------------------------------------------------------------------------------------------------
