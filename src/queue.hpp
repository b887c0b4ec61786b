#pragma once

#include <list>
#include <string>

#include "exact_numbers.hpp"

struct Job;

struct SortableJob
{
    const Job * job;
    Rational release_date;
};

/**
 * @brief Defines the order in which pending jobs are considered for scheduling
 * @details Equal keys fall back on the job identifier, so two queues fed with the
 *          same jobs always list them in the same order.
 */
class SortableJobOrder
{
public:
    virtual ~SortableJobOrder() {}
    virtual bool compare(const SortableJob * j1, const SortableJob * j2) const = 0;
};

// By submission date
class FCFSOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

class LCFSOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

// By number of requested hosts
class AscendingSizeOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

class DescendingSizeOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

// By walltime. Jobs without walltime compare as the largest ones.
class AscendingWalltimeOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

class DescendingWalltimeOrder : public SortableJobOrder
{
public:
    bool compare(const SortableJob * j1, const SortableJob * j2) const override;
};

/**
 * @brief The pending jobs, kept sorted by a SortableJobOrder
 * @details The queue does not own the order nor the jobs.
 */
class Queue
{
public:
    typedef std::list<SortableJob *>::iterator iterator;

    explicit Queue(SortableJobOrder * order);
    Queue(const Queue &) = delete;
    Queue & operator=(const Queue &) = delete;
    ~Queue();

    void append_job(const Job * job);
    void remove_job(const Job * job);
    bool contains_job(const Job * job) const;

    const Job * first_job() const;
    int nb_jobs() const;

    std::string to_string() const;

    iterator begin() { return _jobs.begin(); }
    iterator end() { return _jobs.end(); }

private:
    iterator find(const Job * job);

private:
    std::list<SortableJob *> _jobs;
    SortableJobOrder * _order;
};
