#pragma once

#include <functional>
#include <map>
#include <queue>
#include <string>
#include <vector>

#include <intervalset.hpp>

#include "exact_numbers.hpp"

struct Job;
class ClusterState;
class ResourceSelector;

struct JobAlloc
{
    const Job * job = nullptr;
    Rational begin;
    Rational end;
    bool has_been_inserted = false;
    IntervalSet used_machines;
};

/**
 * @brief The reservations of one scheduling pass
 * @details Every host holds an ordered list of reserved periods. The dates at which some
 *          host becomes free are kept in a min-heap: the earliest start of a job is always
 *          one of them. A schedule is built from scratch at every pass, reservations are
 *          never carried from one pass to the next.
 */
class Schedule
{
public:
    struct Reservation
    {
        Rational begin;
        Rational end;
        std::string job_id; // empty when the host is simply not ready yet
    };

public:
    Schedule(Rational now = 0);

    /**
     * @brief Adds a host that cannot be used before a given date
     * @param[in] host_id The host id
     * @param[in] ready_date The date from which the host is usable, clamped to now.
     *            A date at or after the infinite horizon means the host never becomes free.
     */
    void add_host(int host_id, Rational ready_date);

    /**
     * @brief Finds the earliest period during which the job can run without overlapping any reservation
     * @details The job lasts its walltime, or until the infinite horizon if it has none.
     *          The returned allocation has has_been_inserted set when such a period exists.
     */
    JobAlloc find_earliest_fit(const Job * job, const ClusterState & cluster, ResourceSelector * selector) const;
    void reserve(const JobAlloc & alloc);

    /**
     * @brief find_earliest_fit followed by reserve, for tests and debugging
     * @details The engine reserves only some of the fits it finds and calls the two steps itself.
     */
    JobAlloc add_job_first_fit(const Job * job, const ClusterState & cluster, ResourceSelector * selector);

    IntervalSet available_machines_during_period(Rational begin, Rational end) const;
    IntervalSet machines_reserved_before(Rational date) const;

    // Inspection helpers for tests and debugging
    bool is_reserved(int host_id, Rational begin, Rational end) const;

    Rational now() const;
    Rational infinite_horizon() const;
    std::vector<Rational> candidate_dates() const; // for tests and debugging, in increasing order
    int nb_machines() const;

    std::string to_string() const;

private:
    void push_candidate_date(Rational date);

private:
    Rational _now;
    std::map<int, std::vector<Reservation>> _reservations;
    std::priority_queue<Rational, std::vector<Rational>, std::greater<Rational>> _candidate_dates;
};
