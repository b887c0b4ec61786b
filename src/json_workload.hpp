#pragma once

#include <map>
#include <string>

#include <rapidjson/document.h>

#include <intervalset.hpp>

#include "exact_numbers.hpp"
#include "powersched_tools.hpp"

struct Job
{
    std::string id;  //the job id as given by the workload, w<workload#>!<job#>
    int unique_number; //a running count of jobs, in submission order
    int nb_requested_resources; //number of requested slots
    Rational walltime = -1; //walltime, -1 if the job has none
    bool has_walltime = true;  //whether or not this job has a walltime
    double submission_time = 0;  //time at which the backend submitted the job
    std::string profile; //the execution profile name, opaque to the scheduler
    std::string json_description;

    powersched_tools::JobState state = powersched_tools::JobState::PENDING;
    IntervalSet allocation; //the hosts the job runs (or ran) on
    double start = -1; //the date the job was allocated
    double completion_time = -1; //the date the backend reported the job end
    std::string completion_status; //SUCCESS, FAILED, TIMEOUT or KILLED
    std::string reject_reason;
};

class Workload
{
public:
    Workload() = default;
    Workload(const Workload &) = delete;
    Workload & operator=(const Workload &) = delete;
    ~Workload();

    Job * operator[] (const std::string & job_id);
    const Job * operator[] (const std::string & job_id) const;
    bool contains(const std::string & job_id) const;
    int nb_jobs() const;

    Job * add_job_from_json_object(const rapidjson::Value & object, const std::string & job_id, double submission_time);
    Job * add_job_from_json_description_string(const std::string & json_string, const std::string & job_id, double submission_time);

    std::map<std::string, Job*> & get_jobs();

private:
    Job * job_from_json_object(const rapidjson::Value & object);
    void deallocate();

private:
    std::map<std::string, Job*> _jobs;
    int _job_number = 0;
};
