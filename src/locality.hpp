#pragma once

#include <intervalset.hpp>

struct Job;
class ClusterState;

/**
 * @brief Chooses, among candidate hosts, the ones a job runs on
 * @details Hosts may have several slots: a selection is valid when the sum of the
 *          capacities of its hosts reaches the number of resources the job requests.
 */
class ResourceSelector
{
public:
    ResourceSelector();
    virtual ~ResourceSelector();

    /**
     * @brief Selects hosts for a job among the available ones
     * @param[in] job The job to place
     * @param[in] available The candidate hosts
     * @param[in] cluster Gives the capacity of every host
     * @param[out] allocated The selected hosts, only set when the job fits
     * @return Whether the job fits in the available hosts
     */
    virtual bool fit(const Job * job, const IntervalSet & available, const ClusterState & cluster, IntervalSet & allocated) = 0;
};

// Lowest host ids first
class BasicResourceSelector : public ResourceSelector
{
public:
    BasicResourceSelector();
    ~BasicResourceSelector();

    bool fit(const Job * job, const IntervalSet & available, const ClusterState & cluster, IntervalSet & allocated);
};

// First block of consecutive host ids with enough capacity
class ContiguousResourceSelector : public ResourceSelector
{
public:
    ContiguousResourceSelector();
    ~ContiguousResourceSelector();

    bool fit(const Job * job, const IntervalSet & available, const ClusterState & cluster, IntervalSet & allocated);
};
