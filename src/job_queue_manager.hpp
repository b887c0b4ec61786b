#pragma once

#include <set>
#include <string>
#include <vector>

#include <intervalset.hpp>

#include "json_workload.hpp"
#include "powersched_tools.hpp"
#include "queue.hpp"

/**
 * @brief Keeps the pending, running and terminated jobs of a run
 * @details Jobs live in the Workload; pending ones are also referenced by the Queue,
 *          which gives the scheduling order. Every state change goes through this class.
 */
class JobQueueManager
{
public:
    JobQueueManager(Workload * workload, Queue * queue);

    /**
     * @brief Enqueues a newly submitted job
     * @param[in] job The job, which must be pending and not already queued
     */
    void admit(Job * job);

    void mark_running(const std::string & job_id, const IntervalSet & allocation, double date);
    void mark_completed(const std::string & job_id, const std::string & status, double date);
    void mark_rejected(const std::string & job_id, powersched_tools::REJECT_TYPES reason, double date);

    /**
     * @brief Returns the pending jobs in scheduling order
     * @param[in] limit The maximum number of jobs to return, -1 for all of them
     */
    std::vector<const Job *> next_candidates(int limit = -1) const;

    const Job * job(const std::string & job_id) const;
    const std::set<std::string> & running_jobs() const;

    int nb_pending() const;
    int nb_running() const;
    int nb_completed() const;
    int nb_rejected() const;

private:
    Job * checked_job(const std::string & job_id, powersched_tools::JobState expected, const std::string & target);

private:
    Workload * _workload;
    Queue * _queue;
    std::set<std::string> _running_jobs;
    int _nb_completed = 0;
    int _nb_rejected = 0;
};
