// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "probe-worker.hpp"

#include <map>

// --------------------------------------------------------------------------------------------------------------------

// routes endpoints to one worker per card key, owned by the calling thread
struct ProbeDispatcher {
    ProbePolicy policy;
    std::map<std::string, ProbeWorker*> workers;
};

ProbeDispatcher* initProbeDispatcher(const ProbePolicy& policy);

// Queue an endpoint on the worker of its card, replacing a worker that no longer accepts jobs.
// Returns false only if no worker could be started.
bool addProbeDispatcherJob(ProbeDispatcher* dispatcher,
                           const std::string& name,
                           const std::string& description,
                           bool playback);

// stop all workers and merge their results, lost workers contribute nothing
void finalizeProbeDispatcher(ProbeDispatcher* dispatcher, ProbeResults& results);

void closeProbeDispatcher(ProbeDispatcher* dispatcher);

// --------------------------------------------------------------------------------------------------------------------
