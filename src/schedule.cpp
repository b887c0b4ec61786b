#include "schedule.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/join.hpp>
#include <loguru.hpp>

#include "json_workload.hpp"
#include "locality.hpp"
#include "machine.hpp"
#include "powersched_tools.hpp"

using namespace std;

namespace
{
    // greater than the number of seconds elapsed since the big bang
    const Rational INFINITE_HORIZON = Rational(1e19);
}

Schedule::Schedule(Rational now) :
    _now(now)
{
    push_candidate_date(_now);
}

void Schedule::add_host(int host_id, Rational ready_date)
{
    if (_reservations.count(host_id) != 0)
        throw invalid_argument(powersched_tools::string_format("Host %d is already in the schedule", host_id));

    vector<Reservation> & reservations = _reservations[host_id];

    if (ready_date < _now)
        ready_date = _now;
    if (ready_date > INFINITE_HORIZON)
        ready_date = INFINITE_HORIZON;

    if (ready_date > _now)
    {
        Reservation not_ready;
        not_ready.begin = _now;
        not_ready.end = ready_date;
        reservations.push_back(not_ready);
        push_candidate_date(ready_date);
    }
}

JobAlloc Schedule::find_earliest_fit(const Job *job, const ClusterState &cluster, ResourceSelector *selector) const
{
    JobAlloc alloc;
    alloc.job = job;

    // The heap is copied so that the dates are visited in increasing order without altering it
    auto dates = _candidate_dates;
    Rational previous_date = -1;

    while (!dates.empty())
    {
        Rational begin = dates.top();
        dates.pop();

        if (begin == previous_date || begin >= INFINITE_HORIZON)
            continue;
        previous_date = begin;

        Rational end = INFINITE_HORIZON;
        if (job->has_walltime)
            end = Rational(begin + job->walltime);

        IntervalSet available = available_machines_during_period(begin, end);
        IntervalSet selected;

        if (selector->fit(job, available, cluster, selected))
        {
            alloc.begin = begin;
            alloc.end = end;
            alloc.used_machines = selected;
            alloc.has_been_inserted = true;
            return alloc;
        }
    }

    return alloc;
}

void Schedule::reserve(const JobAlloc &alloc)
{
    if (!alloc.has_been_inserted || alloc.job == nullptr)
        throw invalid_argument("Cannot reserve an allocation that has not been found");

    for (auto host_it = alloc.used_machines.elements_begin(); host_it != alloc.used_machines.elements_end(); ++host_it)
    {
        auto mit = _reservations.find(*host_it);
        if (mit == _reservations.end())
            throw invalid_argument(powersched_tools::string_format("Host %d is not in the schedule", *host_it));

        vector<Reservation> & reservations = mit->second;
        for (const Reservation & reservation : reservations)
        {
            if (reservation.begin < alloc.end && alloc.begin < reservation.end)
                throw invalid_argument(powersched_tools::string_format("Job '%s' overlaps another reservation on host %d",
                                                                       alloc.job->id.c_str(), *host_it));
        }

        Reservation reservation;
        reservation.begin = alloc.begin;
        reservation.end = alloc.end;
        reservation.job_id = alloc.job->id;

        auto insertion_point = std::find_if(reservations.begin(), reservations.end(),
                                            [&alloc](const Reservation & r) { return r.begin > alloc.begin; });
        reservations.insert(insertion_point, reservation);
    }

    if (alloc.end < INFINITE_HORIZON)
        push_candidate_date(alloc.end);

    LOG_F(1, "Reserved %s for job '%s' during [%g, %g)", alloc.used_machines.to_string_brackets().c_str(),
          alloc.job->id.c_str(), alloc.begin.convert_to<double>(), alloc.end.convert_to<double>());
}

JobAlloc Schedule::add_job_first_fit(const Job *job, const ClusterState &cluster, ResourceSelector *selector)
{
    JobAlloc alloc = find_earliest_fit(job, cluster, selector);
    if (alloc.has_been_inserted)
        reserve(alloc);
    return alloc;
}

IntervalSet Schedule::available_machines_during_period(Rational begin, Rational end) const
{
    IntervalSet available;

    for (const auto & mit : _reservations)
    {
        bool free = true;
        for (const Reservation & reservation : mit.second)
        {
            if (reservation.begin >= end)
                break;
            if (begin < reservation.end)
            {
                free = false;
                break;
            }
        }

        if (free)
            available.insert(mit.first);
    }

    return available;
}

IntervalSet Schedule::machines_reserved_before(Rational date) const
{
    IntervalSet reserved;

    for (const auto & mit : _reservations)
    {
        for (const Reservation & reservation : mit.second)
        {
            if (!reservation.job_id.empty() && reservation.begin < date)
            {
                reserved.insert(mit.first);
                break;
            }
        }
    }

    return reserved;
}

bool Schedule::is_reserved(int host_id, Rational begin, Rational end) const
{
    auto mit = _reservations.find(host_id);
    if (mit == _reservations.end())
        return false;

    for (const Reservation & reservation : mit->second)
    {
        if (!reservation.job_id.empty() && reservation.begin < end && begin < reservation.end)
            return true;
    }
    return false;
}

Rational Schedule::now() const
{
    return _now;
}

Rational Schedule::infinite_horizon() const
{
    return INFINITE_HORIZON;
}

vector<Rational> Schedule::candidate_dates() const
{
    vector<Rational> dates;
    auto heap = _candidate_dates;

    while (!heap.empty())
    {
        if (dates.empty() || dates.back() != heap.top())
            dates.push_back(heap.top());
        heap.pop();
    }

    return dates;
}

int Schedule::nb_machines() const
{
    return (int) _reservations.size();
}

string Schedule::to_string() const
{
    vector<string> hosts;

    for (const auto & mit : _reservations)
    {
        vector<string> reservations;
        for (const Reservation & reservation : mit.second)
        {
            reservations.push_back(powersched_tools::string_format("[%g,%g):%s",
                                   reservation.begin.convert_to<double>(),
                                   reservation.end.convert_to<double>(),
                                   reservation.job_id.empty() ? "not_ready" : reservation.job_id.c_str()));
        }
        hosts.push_back(std::to_string(mit.first) + "={" + boost::algorithm::join(reservations, ", ") + "}");
    }

    return "Schedule(now=" + powersched_tools::to_string(_now) + ", " + boost::algorithm::join(hosts, ", ") + ")";
}

void Schedule::push_candidate_date(Rational date)
{
    _candidate_dates.push(date);
}
