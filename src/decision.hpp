#pragma once

#include <set>
#include <string>
#include <vector>

#include <intervalset.hpp>

class AbstractProtocolWriter;

/**
 * @brief A decision taken during one scheduling pass, as sent to the backend
 */
struct Decision
{
    enum class Type
    {
         EXECUTE_JOB
        ,REJECT_JOB
        ,SET_RESOURCE_STATE
        ,CALL_ME_LATER
        ,QUERY_ENERGY
    };

    Type type;
    double date = 0;
    std::string job_id;       // EXECUTE_JOB, REJECT_JOB
    std::string reason;       // REJECT_JOB
    IntervalSet hosts;        // EXECUTE_JOB, SET_RESOURCE_STATE
    int pstate = -1;          // SET_RESOURCE_STATE
    double future_date = -1;  // CALL_ME_LATER
};

class SchedulingDecision
{
public:
    SchedulingDecision();
    SchedulingDecision(const SchedulingDecision &) = delete;
    SchedulingDecision & operator=(const SchedulingDecision &) = delete;
    ~SchedulingDecision();

    void add_execute_job(const std::string & job_id, const IntervalSet & machine_ids, double date);
    void add_reject_job(const std::string & job_id, const std::string & reason, double date);
    void add_set_resource_state(const IntervalSet & machines, int new_state, double date);

    /**
     * @brief Asks the backend to send a REQUESTED_CALL at future_date
     * @details A date is only requested once during the whole run.
     * @return Whether the request has been added (false if this date had already been requested)
     */
    bool add_call_me_later(double future_date, double date);
    bool call_me_later_requested(double future_date) const;

    void add_query_energy_consumption(double date);

    void clear();

    std::string content(double date);
    double last_date() const;
    bool is_empty() const;

    const std::vector<Decision> & decisions() const;

private:
    AbstractProtocolWriter * _proto_writer = nullptr;
    std::vector<Decision> _decisions;
    std::set<double> _call_me_laters;
};
