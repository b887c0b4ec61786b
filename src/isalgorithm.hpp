#pragma once

#include <string>
#include <vector>

#include <rapidjson/document.h>

#include <intervalset.hpp>

#include "config.hpp"

class ClusterState;
class JobQueueManager;
class ResourceSelector;
class SchedulingDecision;
class Workload;

/**
 * @brief Reacts to the events of the backend and decides what to do about them
 * @details An algorithm and the objects it is built with form the whole scheduler state of a run.
 *          Each event of a batch is handed to one on_* callback, in batch order, which applies
 *          it to the cluster and job bookkeeping. make_decisions then runs once per batch.
 */
class ISchedulingAlgorithm
{
public:
    /**
     * @param[in,out] workload Owner of every submitted job
     * @param[in,out] decision Where the replies are written
     * @param[in,out] selector Picks hosts among the free ones
     * @param[in,out] cluster The host tracker, filled on simulation start
     * @param[in,out] jobs The job lifecycle and its pending queue
     * @param[in] config The variant options
     */
    ISchedulingAlgorithm(Workload * workload,
                         SchedulingDecision * decision,
                         ResourceSelector * selector,
                         ClusterState * cluster,
                         JobQueueManager * jobs,
                         const SchedulerConfig & config);
    virtual ~ISchedulingAlgorithm();

    /**
     * @brief Builds the host tracker from the platform description
     * @param[in] simulation_begins_data The data object of the SIMULATION_BEGINS event
     */
    virtual void on_simulation_start(double date, const rapidjson::Value & simulation_begins_data);
    virtual void on_simulation_end(double date);

    // The jobs are already in the workload when this is called
    virtual void on_job_release(double date, const std::vector<std::string> & job_ids);

    /**
     * @brief Marks the jobs completed and gives their hosts back to the cluster
     * @param[in] status The completion status the backend reported
     */
    virtual void on_job_end(double date, const std::vector<std::string> & job_ids, const std::string & status);
    virtual void on_job_killed(double date, const std::vector<std::string> & job_ids);

    /**
     * @brief Confirms a power transition of some hosts
     * @param[in] machines The hosts which reached new_state
     * @param[in] new_state The power state index the hosts are now in
     */
    virtual void on_machine_state_changed(double date, IntervalSet machines, int new_state);

    virtual void on_requested_call(double date);
    virtual void on_no_more_static_job_to_submit_received(double date);
    virtual void on_no_more_external_event_to_occur(double date);

    /**
     * @param[in] consumed_joules The energy consumed by the whole platform since the beginning
     */
    virtual void on_answer_energy_consumption(double date, double consumed_joules);

    // Called once per batch, after every event of the batch has been handed over
    virtual void make_decisions(double date) = 0;

    // Forgets what was remembered for the previous make_decisions call
    void clear_recent_data_structures();

    const SchedulerConfig & config() const { return _config; }

protected:
    Workload * _workload;
    SchedulingDecision * _decision;
    ResourceSelector * _selector;
    ClusterState * _cluster;
    JobQueueManager * _jobs;
    SchedulerConfig _config;

    bool _simulation_ended = false;
    bool _no_more_static_job_to_submit_received = false;

    // Since the previous make_decisions call
    std::vector<std::string> _jobs_released_recently;
};
