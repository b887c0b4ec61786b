#include "job_queue_manager.hpp"

#include <loguru.hpp>

#include "errors.hpp"

using namespace std;
using powersched_tools::JobState;

JobQueueManager::JobQueueManager(Workload * workload, Queue * queue) :
    _workload(workload),
    _queue(queue)
{

}

void JobQueueManager::admit(Job * job)
{
    if (job->state != JobState::PENDING)
        throw InvalidJobTransition("Cannot admit job '" + job->id + "': it is " +
                                   powersched_tools::to_string(job->state));
    if (_queue->contains_job(job))
        throw InvalidJobTransition("Cannot admit job '" + job->id + "': it is already queued");

    _queue->append_job(job);
    LOG_F(1, "Job '%s' admitted. Queue: %s", job->id.c_str(), _queue->to_string().c_str());
}

Job * JobQueueManager::checked_job(const string & job_id, JobState expected, const string & target)
{
    Job * job = (*_workload)[job_id];
    if (job->state != expected)
        throw InvalidJobTransition("Job '" + job_id + "' cannot become " + target + ": it is " +
                                   powersched_tools::to_string(job->state));
    return job;
}

void JobQueueManager::mark_running(const string & job_id, const IntervalSet & allocation, double date)
{
    Job * job = checked_job(job_id, JobState::PENDING, "running");
    if (allocation.is_empty())
        throw InvalidJobTransition("Job '" + job_id + "' cannot run on an empty allocation");

    if (_queue->contains_job(job))
        _queue->remove_job(job);

    job->state = JobState::RUNNING;
    job->allocation = allocation;
    job->start = date;
    _running_jobs.insert(job_id);
}

void JobQueueManager::mark_completed(const string & job_id, const string & status, double date)
{
    Job * job = checked_job(job_id, JobState::RUNNING, "completed");

    job->state = JobState::COMPLETED;
    job->completion_time = date;
    job->completion_status = status;
    _running_jobs.erase(job_id);
    ++_nb_completed;
}

void JobQueueManager::mark_rejected(const string & job_id, powersched_tools::REJECT_TYPES reason, double date)
{
    (void) date;
    Job * job = checked_job(job_id, JobState::PENDING, "rejected");

    if (_queue->contains_job(job))
        _queue->remove_job(job);

    job->state = JobState::REJECTED;
    job->reject_reason = powersched_tools::to_string(reason);
    ++_nb_rejected;
}

vector<const Job *> JobQueueManager::next_candidates(int limit) const
{
    vector<const Job *> candidates;

    for (auto job_it = _queue->begin(); job_it != _queue->end(); ++job_it)
    {
        if (limit >= 0 && (int) candidates.size() >= limit)
            break;
        candidates.push_back((*job_it)->job);
    }

    return candidates;
}

const Job * JobQueueManager::job(const string & job_id) const
{
    const Workload & workload = *_workload;
    return workload[job_id];
}

const set<string> & JobQueueManager::running_jobs() const
{
    return _running_jobs;
}

int JobQueueManager::nb_pending() const
{
    return _queue->nb_jobs();
}

int JobQueueManager::nb_running() const
{
    return (int) _running_jobs.size();
}

int JobQueueManager::nb_completed() const
{
    return _nb_completed;
}

int JobQueueManager::nb_rejected() const
{
    return _nb_rejected;
}
