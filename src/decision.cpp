#include "decision.hpp"

#include "protocol.hpp"

using namespace std;

SchedulingDecision::SchedulingDecision()
{
    _proto_writer = new JsonProtocolWriter;
}

SchedulingDecision::~SchedulingDecision()
{
    delete _proto_writer;
    _proto_writer = nullptr;
}

void SchedulingDecision::add_execute_job(const std::string & job_id, const IntervalSet &machine_ids, double date)
{
    _proto_writer->append_execute_job(job_id, machine_ids, date);

    Decision decision;
    decision.type = Decision::Type::EXECUTE_JOB;
    decision.date = date;
    decision.job_id = job_id;
    decision.hosts = machine_ids;
    _decisions.push_back(decision);
}

void SchedulingDecision::add_reject_job(const std::string & job_id, const string & reason, double date)
{
    _proto_writer->append_reject_job(job_id, date);

    Decision decision;
    decision.type = Decision::Type::REJECT_JOB;
    decision.date = date;
    decision.job_id = job_id;
    decision.reason = reason;
    _decisions.push_back(decision);
}

void SchedulingDecision::add_set_resource_state(const IntervalSet & machines, int new_state, double date)
{
    _proto_writer->append_set_resource_state(machines, std::to_string(new_state), date);

    Decision decision;
    decision.type = Decision::Type::SET_RESOURCE_STATE;
    decision.date = date;
    decision.hosts = machines;
    decision.pstate = new_state;
    _decisions.push_back(decision);
}

bool SchedulingDecision::add_call_me_later(double future_date, double date)
{
    if (_call_me_laters.count(future_date) != 0)
        return false;

    _proto_writer->append_call_me_later(future_date, date);
    _call_me_laters.insert(future_date);

    Decision decision;
    decision.type = Decision::Type::CALL_ME_LATER;
    decision.date = date;
    decision.future_date = future_date;
    _decisions.push_back(decision);
    return true;
}

bool SchedulingDecision::call_me_later_requested(double future_date) const
{
    return _call_me_laters.count(future_date) != 0;
}

void SchedulingDecision::add_query_energy_consumption(double date)
{
    _proto_writer->append_query_consumed_energy(date);

    Decision decision;
    decision.type = Decision::Type::QUERY_ENERGY;
    decision.date = date;
    _decisions.push_back(decision);
}

void SchedulingDecision::clear()
{
    _proto_writer->clear();
    _decisions.clear();
}

string SchedulingDecision::content(double date)
{
    return _proto_writer->generate_current_message(date);
}

double SchedulingDecision::last_date() const
{
    return _proto_writer->last_date();
}

bool SchedulingDecision::is_empty() const
{
    return _proto_writer->is_empty();
}

const vector<Decision> & SchedulingDecision::decisions() const
{
    return _decisions;
}
