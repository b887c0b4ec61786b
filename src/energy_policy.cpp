#include "energy_policy.hpp"

#include <algorithm>

#include <loguru.hpp>

#include "machine.hpp"

using namespace std;

EnergyPolicy::EnergyPolicy(double idle_time_to_sleep, double wake_cooldown, bool enabled) :
    _idle_time_to_sleep(idle_time_to_sleep),
    _wake_cooldown(wake_cooldown),
    _enabled(enabled)
{

}

IntervalSet EnergyPolicy::evaluate(const ClusterState &cluster, const IntervalSet &reserved_hosts, double date) const
{
    IntervalSet to_sedate;
    if (!_enabled)
        return to_sedate;

    IntervalSet idle_hosts = cluster.available_hosts() - reserved_hosts;

    for (auto host_it = idle_hosts.elements_begin(); host_it != idle_hosts.elements_end(); ++host_it)
    {
        const Host & host = cluster[*host_it];
        if (sleep_eligibility_date(host) <= date)
            to_sedate.insert(host.id);
        else if (is_under_hysteresis(host, date))
            LOG_F(1, "Date=%g. Host %d is kept awake (woken at %g)", date, host.id, host.woken_at);
    }

    return to_sedate;
}

double EnergyPolicy::next_evaluation_date(const ClusterState &cluster, const IntervalSet &reserved_hosts, double date) const
{
    if (!_enabled)
        return -1;

    double next_date = -1;
    IntervalSet idle_hosts = cluster.available_hosts() - reserved_hosts;

    for (auto host_it = idle_hosts.elements_begin(); host_it != idle_hosts.elements_end(); ++host_it)
    {
        double eligibility_date = sleep_eligibility_date(cluster[*host_it]);
        if (eligibility_date > date && (next_date < 0 || eligibility_date < next_date))
            next_date = eligibility_date;
    }

    return next_date;
}

bool EnergyPolicy::is_under_hysteresis(const Host &host, double date) const
{
    return !host.ran_job_since_wake && host.woken_at >= 0 && date < host.woken_at + _wake_cooldown;
}

double EnergyPolicy::sleep_eligibility_date(const Host &host) const
{
    double eligibility_date = host.idle_since + _idle_time_to_sleep;

    if (!host.ran_job_since_wake && host.woken_at >= 0)
        eligibility_date = std::max(eligibility_date, host.woken_at + _wake_cooldown);

    return eligibility_date;
}

bool EnergyPolicy::enabled() const
{
    return _enabled;
}
