#ifndef MACHINE_HPP
#define MACHINE_HPP
#include <map>
#include <string>
#include <vector>
#include <intervalset.hpp>

#include <rapidjson/document.h>

enum class PowerState
{
     IDLE            //!< On, no job
    ,COMPUTING       //!< On, running a job
    ,SWITCHING_ON    //!< Asked to wake up, not confirmed by the backend yet
    ,SWITCHING_OFF   //!< Asked to sleep, not confirmed by the backend yet
    ,SLEEPING        //!< Off, cannot run jobs
};

std::string to_string(PowerState state);

struct Host{
    int id;
    std::string name;
    int capacity = 1;
    PowerState state = PowerState::IDLE;
    std::string job_id;                  // the job currently assigned, empty if none
    double transition_deadline = -1;     // expected end of the pending switch, -1 if none
    double idle_since = 0;               // start of the current idle period
    double woken_at = -1;                // date of the last confirmed wake-up, -1 if never woken
    bool ran_job_since_wake = true;
    std::string to_json_string() const;
};

/**
 * @brief Tracks the power state and the job of every host of the cluster
 * @details The backend is authoritative: requested transitions are only completed by
 *          apply_state_changed. Host ids are the backend resource ids.
 */
class ClusterState{
    public:
        ClusterState(int pstate_compute, int pstate_sleep,
                     double switch_on_delay = 0, double switch_off_delay = 0);

        /**
         * @brief Builds the hosts from the SIMULATION_BEGINS event data
         * @details One host per 'compute_resources' entry if present, otherwise
         *          'nb_resources' (or 'nb_compute_resources') single-slot hosts.
         */
        void ingest_topology(const rapidjson::Value & simulation_begins_data, double date);
        void add_host(int id, const std::string & name, int capacity, PowerState initial_state, double date);

        void apply_state_changed(const IntervalSet & hosts, int new_pstate, double date);

        void request_power_on(const IntervalSet & hosts, double date);
        void request_power_off(const IntervalSet & hosts, double date);

        void assign_job(const std::string & job_id, const IntervalSet & hosts, double date);
        void release_job(const std::string & job_id, const IntervalSet & hosts, double date);

        IntervalSet available_hosts() const;
        IntervalSet hosts_in_state(PowerState state) const;
        IntervalSet all_hosts() const;
        int nb_hosts_in_state(PowerState state) const;

        const Host & operator[](int host_id) const;
        bool contains(int host_id) const;
        void check_hosts_exist(const IntervalSet & hosts) const;
        int nb_hosts() const;
        int total_capacity() const;
        int capacity_of(const IntervalSet & hosts) const;

        int pstate_compute() const;
        int pstate_sleep() const;
        double switch_on_delay() const;
        double switch_off_delay() const;

        std::string to_json_string() const;
    private:
        Host & host(int host_id);
        void on_compute_pstate(Host & host, double date);
        void on_sleep_pstate(Host & host, double date);

    private:
        std::map<int, Host> _hostsById;
        int _pstate_compute;
        int _pstate_sleep;
        double _switch_on_delay;
        double _switch_off_delay;
        int _total_capacity = 0;
};

#endif
