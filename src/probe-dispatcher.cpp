// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-dispatcher.hpp"
#include "probe-discovery.hpp"

// --------------------------------------------------------------------------------------------------------------------

ProbeDispatcher* initProbeDispatcher(const ProbePolicy& policy)
{
    ProbeDispatcher* const dispatcher = new ProbeDispatcher;
    dispatcher->policy = policy;
    return dispatcher;
}

bool addProbeDispatcherJob(ProbeDispatcher* const dispatcher,
                           const std::string& name,
                           const std::string& description,
                           const bool playback)
{
    const std::string cardKey = getCardKey(name);

    std::map<std::string, ProbeWorker*>::iterator it = dispatcher->workers.find(cardKey);

    if (it != dispatcher->workers.end())
    {
        if (isProbeWorkerRunning(it->second) && addProbeWorkerJob(it->second, name, description, playback))
            return true;

        DEBUGPRINT("card %s: worker is gone, starting a new one", cardKey.c_str());
        closeProbeWorker(it->second);
        dispatcher->workers.erase(it);
    }

    ProbeWorker* const worker = initProbeWorker(cardKey, dispatcher->policy);

    if (worker == nullptr)
    {
        WARNPRINT("card %s: failed to start probing thread, %s will be ignored", cardKey.c_str(), name.c_str());
        return false;
    }

    dispatcher->workers[cardKey] = worker;

    return addProbeWorkerJob(worker, name, description, playback);
}

void finalizeProbeDispatcher(ProbeDispatcher* const dispatcher, ProbeResults& results)
{
    for (const auto& entry : dispatcher->workers)
    {
        if (! finishProbeWorker(entry.second, results))
            DEBUGPRINT("card %s: worker lost, results dropped", entry.first.c_str());

        closeProbeWorker(entry.second);
    }

    dispatcher->workers.clear();
}

void closeProbeDispatcher(ProbeDispatcher* const dispatcher)
{
    for (const auto& entry : dispatcher->workers)
        closeProbeWorker(entry.second);

    delete dispatcher;
}

// --------------------------------------------------------------------------------------------------------------------
