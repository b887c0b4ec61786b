#include "isalgorithm.hpp"

#include <loguru.hpp>

#include "job_queue_manager.hpp"
#include "json_workload.hpp"
#include "machine.hpp"
#include "powersched_tools.hpp"

using namespace std;

ISchedulingAlgorithm::ISchedulingAlgorithm(Workload *workload,
                                           SchedulingDecision *decision,
                                           ResourceSelector *selector,
                                           ClusterState *cluster,
                                           JobQueueManager *jobs,
                                           const SchedulerConfig & config) :
    _workload(workload), _decision(decision), _selector(selector),
    _cluster(cluster), _jobs(jobs), _config(config)
{

}

ISchedulingAlgorithm::~ISchedulingAlgorithm()
{

}

void ISchedulingAlgorithm::clear_recent_data_structures()
{
    _jobs_released_recently.clear();
}

void ISchedulingAlgorithm::on_simulation_start(double date, const rapidjson::Value & simulation_begins_data)
{
    _cluster->ingest_topology(simulation_begins_data, date);
}

void ISchedulingAlgorithm::on_simulation_end(double date)
{
    _simulation_ended = true;
    LOG_F(INFO, "Date=%g. Simulation ended. %d jobs completed, %d rejected, %d still pending, %d still running",
          date, _jobs->nb_completed(), _jobs->nb_rejected(), _jobs->nb_pending(), _jobs->nb_running());
}

void ISchedulingAlgorithm::on_job_release(double date, const vector<string> &job_ids)
{
    (void) date;
    for (const string & job_id : job_ids)
        _jobs_released_recently.push_back(job_id);
}

void ISchedulingAlgorithm::on_job_end(double date, const vector<string> &job_ids, const string & status)
{
    for (const string & job_id : job_ids)
    {
        const IntervalSet hosts = _jobs->job(job_id)->allocation;

        _jobs->mark_completed(job_id, status, date);
        _cluster->release_job(job_id, hosts, date);

        LOG_F(INFO, "Date=%g. Job '%s' ended (%s), hosts %s released", date, job_id.c_str(),
              status.c_str(), hosts.to_string_brackets().c_str());
    }
}

void ISchedulingAlgorithm::on_job_killed(double date, const vector<string> &job_ids)
{
    on_job_end(date, job_ids, powersched_tools::job_status::KILLED);
}

void ISchedulingAlgorithm::on_machine_state_changed(double date, IntervalSet machines, int new_state)
{
    _cluster->apply_state_changed(machines, new_state, date);
}

void ISchedulingAlgorithm::on_requested_call(double date)
{
    LOG_F(1, "Date=%g. Requested call received", date);
}

void ISchedulingAlgorithm::on_no_more_static_job_to_submit_received(double date)
{
    LOG_F(1, "Date=%g. No more static job will be submitted", date);
    _no_more_static_job_to_submit_received = true;
}

void ISchedulingAlgorithm::on_no_more_external_event_to_occur(double date)
{
    LOG_F(1, "Date=%g. No more external event will occur", date);
}

void ISchedulingAlgorithm::on_answer_energy_consumption(double date, double consumed_joules)
{
    LOG_F(1, "Date=%g. Platform consumed %g J so far", date, consumed_joules);
}
