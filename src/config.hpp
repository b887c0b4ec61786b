#pragma once

#include <string>

#include <rapidjson/document.h>

/**
 * @brief The scheduling variant options, given as a JSON object on the command line
 * @details Every member is optional. Members with an unexpected type or value raise a ConfigError.
 */
struct SchedulerConfig
{
    int pstate_compute = 0;              //!< The pstate in which hosts can compute
    int pstate_sleep = 1;                //!< The pstate in which hosts sleep
    double idle_time_to_sleep = 1800;    //!< A host idle for at least this long is put to sleep
    double wake_cooldown = 600;          //!< A woken host cannot be put to sleep again before this delay unless it ran a job
    double switch_on_delay = 1;          //!< Expected duration of a sleeping -> idle transition
    double switch_off_delay = 1;         //!< Expected duration of an idle -> sleeping transition
    bool allow_wake = true;              //!< Whether sleeping hosts can be woken for pending jobs
    bool power_management = true;        //!< Whether idle hosts are put to sleep at all
    int backfill_window = -1;            //!< How many pending jobs are considered per pass (-1: all)
    int reservation_depth = -1;          //!< How many jobs that cannot start get a reservation (-1: all)
    bool energy_monitoring = false;      //!< Whether the consumed energy is periodically queried
    double record_interval = 60;         //!< The period of the state record callbacks
    std::string record_file;             //!< Where the CSV state record is written (empty: nowhere)

    static SchedulerConfig from_json(const rapidjson::Value & options);
    static SchedulerConfig from_json_string(const std::string & options);
};
