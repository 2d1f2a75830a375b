#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include <pthread.h>

#include "job.hpp"
#include "log.hpp"
#include "scheduler.hpp"

using std::string;
using std::vector;

struct Worker
{
    pthread_t thread;
    bool      started = false;
};

// the only state the workers share
struct JobQueue
{
    vector<FileJob> const* jobs   = nullptr;
    JobRunner              runner = nullptr;
    size_t                 next   = 0;
    BatchReport            report;
    pthread_mutex_t        mtx;
};


void addOutcome(BatchReport& report, JobOutcome outcome)
{
    switch (outcome.status) {
    case JobStatus::Success:
        ++report.succeeded;
        break;
    case JobStatus::Skipped:
        ++report.skipped;
        break;
    case JobStatus::Failed:
        ++report.failed;
        report.failures.push_back(outcome.sourcePath + ": " + outcome.error);
        break;
    }

    report.outcomes.push_back(std::move(outcome));
}

static void logProgress(JobOutcome const& outcome, size_t done, size_t total)
{
    auto const counter = "[" + std::to_string(done) + "/" + std::to_string(total) + "] ";

    switch (outcome.status) {
    case JobStatus::Success:
        logInfo(counter + outcome.sourcePath + " -> " + outcome.destPath);
        break;
    case JobStatus::Skipped:
        logWarning(counter + "skipped " + outcome.sourcePath + ": " + outcome.error);
        break;
    case JobStatus::Failed:
        logError(counter + outcome.sourcePath + ": " + outcome.error);
        break;
    }
}

static JobOutcome runOne(JobRunner runner, FileJob const& job)
{
    try {
        return runner(job);
    }
    catch (std::exception const& e) {
        JobOutcome outcome;
        outcome.sourcePath = job.sourcePath;
        outcome.destPath   = job.destPath;
        outcome.status     = JobStatus::Failed;
        outcome.error      = e.what();
        return outcome;
    }
}

// false once the queue is drained
static bool takeJob(JobQueue& queue, size_t& idx)
{
    MutexLock lock(queue.mtx);

    if (queue.next >= queue.jobs->size())
        return false;

    idx = queue.next++;
    return true;
}

static void drainQueue(JobQueue& queue)
{
    auto const total = queue.jobs->size();
    size_t idx = 0;

    while (takeJob(queue, idx)) {
        auto outcome = runOne(queue.runner, (*queue.jobs)[idx]);
        auto const logged = outcome;
        size_t done = 0;

        {
            MutexLock lock(queue.mtx);
            addOutcome(queue.report, std::move(outcome));
            done = queue.report.outcomes.size();
        }

        logProgress(logged, done, total);
    }
}

// thread worker: takes jobs until the queue is drained
static void* jobWorker(void* arg)
{
    auto queue = static_cast<JobQueue*>(arg);

    try {
        drainQueue(*queue);
    }
    catch (std::exception const& e) {
        // bookkeeping ran out of memory, the other workers carry on
        logError(string("worker stopped: ") + e.what());
    }

    return nullptr;
}


BatchReport runJobs(vector<FileJob> const& jobs, int32_t workerCount, JobRunner runner)
{
    JobQueue queue;
    queue.jobs   = &jobs;
    queue.runner = runner ? runner : &runFileJob;
    queue.report.totalJobs = jobs.size();
    queue.report.outcomes.reserve(jobs.size());
    queue.report.failures.reserve(jobs.size());

    if (::pthread_mutex_init(&queue.mtx, nullptr) != 0)
        throw std::runtime_error("pthread_mutex_init() failed");

    if (workerCount <= 1 || jobs.size() <= 1) {
        jobWorker(&queue);
        ::pthread_mutex_destroy(&queue.mtx);
        return std::move(queue.report);
    }

    auto const poolSize = std::min(static_cast<size_t>(workerCount), jobs.size());
    vector<Worker> workers(poolSize);
    size_t started = 0;

    for (auto& worker : workers) {
        worker.started = ::pthread_create(&worker.thread, nullptr, &jobWorker, &queue) == 0;
        if (worker.started)
            ++started;
    }

    logDebug("started " + std::to_string(started) + " of " + std::to_string(poolSize) + " workers");

    if (started < poolSize)
        logWarning("pthread_create() failed, running with " + std::to_string(started) + " worker(s)");

    if (started == 0)
        jobWorker(&queue); // no pool at all, drain on this thread

    for (auto& worker : workers) {
        if (worker.started)
            ::pthread_join(worker.thread, nullptr);
    }

    ::pthread_mutex_destroy(&queue.mtx);
    return std::move(queue.report);
}
