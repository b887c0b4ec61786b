#include "energy_backfilling.hpp"

#include <loguru.hpp>

#include "../decision.hpp"
#include "../job_queue_manager.hpp"
#include "../json_workload.hpp"
#include "../locality.hpp"
#include "../machine.hpp"
#include "../powersched_tools.hpp"

using namespace std;
using powersched_tools::REJECT_TYPES;

EnergyBackfilling::EnergyBackfilling(Workload *workload, SchedulingDecision *decision, ResourceSelector *selector,
                                     ClusterState *cluster, JobQueueManager *jobs, const SchedulerConfig & config) :
    ISchedulingAlgorithm(workload, decision, selector, cluster, jobs, config),
    _energy_policy(config.idle_time_to_sleep, config.wake_cooldown, config.power_management)
{
    if (!_config.record_file.empty())
        _recorder.open(_config.record_file);

    LOG_F(INFO, "Energy backfilling: reservation_depth=%d, backfill_window=%d, power_management=%s, allow_wake=%s",
          _config.reservation_depth, _config.backfill_window,
          _config.power_management ? "true" : "false", _config.allow_wake ? "true" : "false");
}

EnergyBackfilling::~EnergyBackfilling()
{

}

void EnergyBackfilling::on_simulation_start(double date, const rapidjson::Value & simulation_begins_data)
{
    ISchedulingAlgorithm::on_simulation_start(date, simulation_begins_data);
    _next_record_date = date;
}

void EnergyBackfilling::on_answer_energy_consumption(double date, double consumed_joules)
{
    _recorder.on_energy_answer(consumed_joules, date);
    LOG_F(1, "Date=%g. Consumed energy: %g J, power: %g W", date, consumed_joules, _recorder.current_power());
}

void EnergyBackfilling::make_decisions(double date)
{
    if (_simulation_ended)
        return;

    handle_released_jobs(date);

    Schedule schedule = build_schedule(date);
    handle_schedule(schedule, date);
    handle_power(schedule, date);
    handle_monitoring(date);
}

void EnergyBackfilling::handle_released_jobs(double date)
{
    for (const string & new_job_id : _jobs_released_recently)
    {
        Job * new_job = (*_workload)[new_job_id];

        if (new_job->nb_requested_resources > _cluster->total_capacity())
        {
            LOG_F(INFO, "Date=%g. Rejecting job '%s': it requests %d resources, the cluster has %d",
                  date, new_job_id.c_str(), new_job->nb_requested_resources, _cluster->total_capacity());
            _decision->add_reject_job(new_job_id, powersched_tools::to_string(REJECT_TYPES::INFEASIBLE_REQUEST), date);
            _jobs->mark_rejected(new_job_id, REJECT_TYPES::INFEASIBLE_REQUEST, date);
        }
        else
            _jobs->admit(new_job);
    }
}

Rational EnergyBackfilling::host_ready_date(const Host & host, double date, Rational infinite_horizon) const
{
    Rational now(date);

    switch (host.state)
    {
        case PowerState::IDLE:
            return now;
        case PowerState::COMPUTING:
        {
            const Job * job = _jobs->job(host.job_id);
            if (!job->has_walltime)
                return infinite_horizon;
            return Rational(Rational(job->start) + job->walltime);
        }
        case PowerState::SWITCHING_ON:
            return Rational(std::max(Rational(host.transition_deadline), now));
        case PowerState::SLEEPING:
            return Rational(now + Rational(_cluster->switch_on_delay()));
        case PowerState::SWITCHING_OFF:
            return Rational(std::max(Rational(host.transition_deadline), now) + Rational(_cluster->switch_on_delay()));
    }
    return infinite_horizon;
}

Schedule EnergyBackfilling::build_schedule(double date) const
{
    Rational now(date);
    Schedule schedule(now);
    IntervalSet all_hosts = _cluster->all_hosts();

    for (auto host_it = all_hosts.elements_begin(); host_it != all_hosts.elements_end(); ++host_it)
    {
        const Host & host = (*_cluster)[*host_it];
        schedule.add_host(host.id, host_ready_date(host, date, schedule.infinite_horizon()));
    }

    return schedule;
}

void EnergyBackfilling::handle_schedule(Schedule & schedule, double date)
{
    const vector<const Job *> candidates = _jobs->next_candidates(_config.backfill_window);
    const IntervalSet idle_hosts = _cluster->available_hosts();
    const IntervalSet sleeping_hosts = _cluster->hosts_in_state(PowerState::SLEEPING);
    const Rational now(date);
    const Rational wake_horizon = Rational(now + Rational(_cluster->switch_on_delay()));

    IntervalSet hosts_to_awaken;
    vector<JobAlloc> jobs_to_execute;
    int nb_reservations = 0;

    for (const Job * job : candidates)
    {
        JobAlloc alloc = schedule.find_earliest_fit(job, *_cluster, _selector);

        if (!alloc.has_been_inserted)
        {
            LOG_F(1, "Date=%g. No period can hold job '%s'", date, job->id.c_str());
            continue;
        }

        // A host ready now is not necessarily idle (no switch-on delay, late confirmation):
        // idle hosts free for the whole period are preferred over it
        if (alloc.begin == now && !(alloc.used_machines - idle_hosts).is_empty())
        {
            IntervalSet idle_selection;
            if (_selector->fit(job, idle_hosts & schedule.available_machines_during_period(alloc.begin, alloc.end),
                               *_cluster, idle_selection))
                alloc.used_machines = idle_selection;
        }

        // Only idle hosts can be allocated, the others are waited for through a reservation
        if (alloc.begin == now && (alloc.used_machines - idle_hosts).is_empty())
        {
            schedule.reserve(alloc);
            jobs_to_execute.push_back(alloc);
            continue;
        }

        if (_config.reservation_depth != -1 && nb_reservations >= _config.reservation_depth)
            continue;

        schedule.reserve(alloc);
        ++nb_reservations;

        IntervalSet asleep = alloc.used_machines & sleeping_hosts;
        if (_config.allow_wake && !asleep.is_empty() && alloc.begin <= wake_horizon)
            hosts_to_awaken += asleep;
    }

    if (!hosts_to_awaken.is_empty())
    {
        LOG_F(INFO, "Date=%g. Waking up hosts %s", date, hosts_to_awaken.to_string_brackets().c_str());
        _cluster->request_power_on(hosts_to_awaken, date);
        _decision->add_set_resource_state(hosts_to_awaken, _cluster->pstate_compute(), date);
    }

    for (const JobAlloc & alloc : jobs_to_execute)
    {
        LOG_F(INFO, "Date=%g. Executing job '%s' on hosts %s", date, alloc.job->id.c_str(),
              alloc.used_machines.to_string_brackets().c_str());
        _decision->add_execute_job(alloc.job->id, alloc.used_machines, date);
        _jobs->mark_running(alloc.job->id, alloc.used_machines, date);
        _cluster->assign_job(alloc.job->id, alloc.used_machines, date);
    }

    LOG_F(1, "Date=%g. %s", date, schedule.to_string().c_str());
}

void EnergyBackfilling::handle_power(const Schedule & schedule, double date)
{
    if (!_energy_policy.enabled())
        return;

    // Sleeping a host reserved before it could switch off and on again would delay its job
    const Rational protect_until = Rational(Rational(date) + Rational(_cluster->switch_off_delay())
                                            + Rational(_cluster->switch_on_delay()));
    const IntervalSet reserved_hosts = schedule.machines_reserved_before(protect_until);

    IntervalSet hosts_to_sedate = _energy_policy.evaluate(*_cluster, reserved_hosts, date);
    if (!hosts_to_sedate.is_empty())
    {
        LOG_F(INFO, "Date=%g. Switching off idle hosts %s", date, hosts_to_sedate.to_string_brackets().c_str());
        _cluster->request_power_off(hosts_to_sedate, date);
        _decision->add_set_resource_state(hosts_to_sedate, _cluster->pstate_sleep(), date);
    }

    double next_evaluation_date = _energy_policy.next_evaluation_date(*_cluster, reserved_hosts, date);
    if (next_evaluation_date > date)
        _decision->add_call_me_later(next_evaluation_date, date);
}

bool EnergyBackfilling::work_remains() const
{
    if (_jobs->nb_pending() > 0 || _jobs->nb_running() > 0)
        return true;
    return _workload->nb_jobs() == 0 && !_no_more_static_job_to_submit_received;
}

void EnergyBackfilling::handle_monitoring(double date)
{
    if (!_config.energy_monitoring)
    {
        if (_recorder.is_open())
            _recorder.record(*_cluster, *_jobs, date);
        return;
    }

    const bool work = work_remains();

    // A periodic call is pending, or nothing happens that is worth monitoring
    if (date < _next_record_date && (_monitoring_active || !work))
        return;

    _recorder.record(*_cluster, *_jobs, date);
    _decision->add_query_energy_consumption(date);

    _next_record_date = date + _config.record_interval;
    _monitoring_active = work;
    if (work)
        _decision->add_call_me_later(_next_record_date, date);
}

const StateRecorder & EnergyBackfilling::recorder() const
{
    return _recorder;
}

const EnergyPolicy & EnergyBackfilling::energy_policy() const
{
    return _energy_policy;
}
