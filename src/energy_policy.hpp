#pragma once

#include <intervalset.hpp>

class ClusterState;
struct Host;

/**
 * @brief Decides which idle hosts should be switched off
 * @details A host is put to sleep once it has been idle for idle_time_to_sleep seconds,
 *          unless it is reserved for a pending job or under hysteresis: a host woken up
 *          cannot be switched off before it ran a job or wake_cooldown seconds elapsed.
 */
class EnergyPolicy
{
public:
    EnergyPolicy(double idle_time_to_sleep, double wake_cooldown, bool enabled = true);

    /**
     * @brief Selects the idle hosts to switch off
     * @param[in] cluster The cluster state, as of the latest event batch
     * @param[in] reserved_hosts The hosts some pending job is waiting for in this pass
     * @param[in] date The current date
     * @return The hosts that should be requested to switch off
     */
    IntervalSet evaluate(const ClusterState & cluster, const IntervalSet & reserved_hosts, double date) const;

    /**
     * @brief Returns the earliest date after the current one at which an idle host becomes
     *        eligible for sleep, -1 if no host will
     */
    double next_evaluation_date(const ClusterState & cluster, const IntervalSet & reserved_hosts, double date) const;

    bool is_under_hysteresis(const Host & host, double date) const;
    double sleep_eligibility_date(const Host & host) const;

    bool enabled() const;

private:
    double _idle_time_to_sleep;
    double _wake_cooldown;
    bool _enabled;
};
