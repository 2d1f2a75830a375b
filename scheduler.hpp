#ifndef SCHEDULER_H
#define SCHEDULER_H

#include "batchaudio.hpp"

using JobRunner = JobOutcome (*)(FileJob const& job);

// workerCount <= 1: jobs run one by one on the calling thread, in order.
// Otherwise a pool of workerCount pthreads pulls jobs from a shared queue and
// outcomes are recorded in completion order. Returns once every job has
// reached a terminal state; a failing job never stops the others.
BatchReport runJobs(std::vector<FileJob> const& jobs, int32_t workerCount,
                    JobRunner runner = nullptr);

// append one outcome and update the counters
void addOutcome(BatchReport& report, JobOutcome outcome);

#endif // SCHEDULER_H
