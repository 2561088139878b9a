// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "probe-worker.hpp"
#include "probe-search.hpp"

#include <cerrno>
#include <deque>
#include <exception>
#include <memory>
#include <pthread.h>
#include <semaphore.h>

// --------------------------------------------------------------------------------------------------------------------

struct ProbeWorker {
    std::string cardKey;
    ProbePolicy policy;

    pthread_t thread;
    pthread_mutex_t lock;
    sem_t sem;

    // protected by lock
    std::deque<ProbeJob> jobs;
    bool closed = false;
    bool finished = false;
    bool lost = false;

    // only touched by the worker thread until joined
    ProbeResults results;

    // dispatching thread only
    bool joined = false;
};

// --------------------------------------------------------------------------------------------------------------------

static bool pushProbeWorkerJob(ProbeWorker* const worker, const ProbeJob& job)
{
    pthread_mutex_lock(&worker->lock);

    if (worker->closed)
    {
        pthread_mutex_unlock(&worker->lock);
        return false;
    }

    worker->jobs.push_back(job);

    if (job.type == kProbeJobDone)
        worker->closed = true;

    pthread_mutex_unlock(&worker->lock);

    sem_post(&worker->sem);
    return true;
}

static bool popProbeWorkerJob(ProbeWorker* const worker, ProbeJob& job)
{
    while (sem_wait(&worker->sem) != 0)
    {
        if (errno != EINTR)
            return false;
    }

    pthread_mutex_lock(&worker->lock);
    job = worker->jobs.front();
    worker->jobs.pop_front();
    pthread_mutex_unlock(&worker->lock);
    return true;
}

static void sendProbeWorkerDone(ProbeWorker* const worker)
{
    ProbeJob job;
    job.type = kProbeJobDone;
    job.playback = false;
    pushProbeWorkerJob(worker, job);
}

// channel severed, nothing this worker collected is returned
static void markProbeWorkerLost(ProbeWorker* const worker)
{
    pthread_mutex_lock(&worker->lock);
    worker->closed = true;
    worker->lost = true;
    pthread_mutex_unlock(&worker->lock);
}

static void runProbeWorker(ProbeWorker* const worker)
{
    DEBUGPRINT("card %s: worker started", worker->cardKey.c_str());

    for (ProbeJob job;;)
    {
        if (! popProbeWorkerJob(worker, job))
        {
            WARNPRINT("card %s: worker queue failed, its devices will be ignored", worker->cardKey.c_str());
            markProbeWorkerLost(worker);
            return;
        }

        if (job.type == kProbeJobDone)
            break;

        ProbeEndpoint endpoint;
        if (! probeEndpoint(worker->policy, job.name, job.description, job.cardKey, job.playback, endpoint))
            continue;

        if (job.playback)
            worker->results.playback.push_back(endpoint);
        else
            worker->results.capture.push_back(endpoint);
    }

    DEBUGPRINT("card %s: worker done, %zu playback and %zu capture endpoints",
               worker->cardKey.c_str(), worker->results.playback.size(), worker->results.capture.size());
}

static void* _probe_worker_thread(void* const arg)
{
    ProbeWorker* const worker = static_cast<ProbeWorker*>(arg);

    try {
        runProbeWorker(worker);
    } catch (const std::exception& e) {
        WARNPRINT("card %s: probing failed, its devices will be ignored: %s", worker->cardKey.c_str(), e.what());
        markProbeWorkerLost(worker);
    }

    pthread_mutex_lock(&worker->lock);
    worker->finished = true;
    pthread_mutex_unlock(&worker->lock);
    return nullptr;
}

static void joinProbeWorker(ProbeWorker* const worker)
{
    if (worker->joined)
        return;

    sendProbeWorkerDone(worker);
    pthread_join(worker->thread, nullptr);
    worker->joined = true;
}

// --------------------------------------------------------------------------------------------------------------------

ProbeWorker* initProbeWorker(const std::string& cardKey, const ProbePolicy& policy)
{
    std::unique_ptr<ProbeWorker> worker = std::unique_ptr<ProbeWorker>(new ProbeWorker);
    worker->cardKey = cardKey;
    worker->policy = policy;

    if (pthread_mutex_init(&worker->lock, nullptr) != 0)
    {
        DEBUGPRINT("pthread_mutex_init fail");
        return nullptr;
    }

    if (sem_init(&worker->sem, 0, 0) != 0)
    {
        DEBUGPRINT("sem_init fail");
        goto error_lock;
    }

    if (pthread_create(&worker->thread, nullptr, _probe_worker_thread, worker.get()) != 0)
    {
        DEBUGPRINT("pthread_create fail");
        goto error_sem;
    }

    return worker.release();

error_sem:
    sem_destroy(&worker->sem);

error_lock:
    pthread_mutex_destroy(&worker->lock);
    return nullptr;
}

bool addProbeWorkerJob(ProbeWorker* const worker,
                       const std::string& name,
                       const std::string& description,
                       const bool playback)
{
    ProbeJob job;
    job.type = kProbeJobGetDevice;
    job.name = name;
    job.description = description;
    job.cardKey = worker->cardKey;
    job.playback = playback;

    return pushProbeWorkerJob(worker, job);
}

bool isProbeWorkerRunning(ProbeWorker* const worker)
{
    pthread_mutex_lock(&worker->lock);
    const bool running = ! worker->finished;
    pthread_mutex_unlock(&worker->lock);
    return running;
}

bool finishProbeWorker(ProbeWorker* const worker, ProbeResults& results)
{
    joinProbeWorker(worker);

    if (worker->lost)
        return false;

    results.playback.insert(results.playback.end(), worker->results.playback.begin(), worker->results.playback.end());
    results.capture.insert(results.capture.end(), worker->results.capture.begin(), worker->results.capture.end());
    worker->results = ProbeResults();
    return true;
}

void closeProbeWorker(ProbeWorker* const worker)
{
    joinProbeWorker(worker);

    sem_destroy(&worker->sem);
    pthread_mutex_destroy(&worker->lock);
    delete worker;
}

// --------------------------------------------------------------------------------------------------------------------
