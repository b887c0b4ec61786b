#pragma once

#include "../energy_policy.hpp"
#include "../exact_numbers.hpp"
#include "../isalgorithm.hpp"
#include "../monitoring.hpp"
#include "../schedule.hpp"

struct Host;

/**
 * @brief Backfilling with reservations, which puts idle hosts to sleep and wakes them up for pending jobs
 * @details Reservations are rebuilt at every pass from the current cluster state.
 *          With reservation_depth = -1 every pending job gets a reservation (conservative backfilling),
 *          with reservation_depth = 1 only the first one does (EASY backfilling).
 */
class EnergyBackfilling : public ISchedulingAlgorithm
{
public:
    EnergyBackfilling(Workload * workload, SchedulingDecision * decision, ResourceSelector * selector,
                      ClusterState * cluster, JobQueueManager * jobs, const SchedulerConfig & config);
    virtual ~EnergyBackfilling();

    virtual void on_simulation_start(double date, const rapidjson::Value & simulation_begins_data);
    virtual void on_answer_energy_consumption(double date, double consumed_joules);

    virtual void make_decisions(double date);

    /**
     * @brief Builds the schedule of the current pass: every host is blocked until the date it can compute
     */
    Schedule build_schedule(double date) const;
    Rational host_ready_date(const Host & host, double date, Rational infinite_horizon) const;

    const StateRecorder & recorder() const;
    const EnergyPolicy & energy_policy() const;

private:
    void handle_released_jobs(double date);
    void handle_schedule(Schedule & schedule, double date);
    void handle_power(const Schedule & schedule, double date);
    void handle_monitoring(double date);
    bool work_remains() const;

private:
    EnergyPolicy _energy_policy;
    StateRecorder _recorder;
    double _next_record_date = 0;
    bool _monitoring_active = false;
};
