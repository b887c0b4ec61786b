#include "locality.hpp"

#include "json_workload.hpp"
#include "machine.hpp"

using namespace std;

ResourceSelector::ResourceSelector()
{

}

ResourceSelector::~ResourceSelector()
{

}

BasicResourceSelector::BasicResourceSelector()
{

}

BasicResourceSelector::~BasicResourceSelector()
{

}

bool BasicResourceSelector::fit(const Job *job, const IntervalSet &available, const ClusterState &cluster, IntervalSet &allocated)
{
    IntervalSet selected;
    int capacity = 0;

    for (auto host_it = available.elements_begin(); host_it != available.elements_end(); ++host_it)
    {
        if (capacity >= job->nb_requested_resources)
            break;

        selected.insert(*host_it);
        capacity += cluster[*host_it].capacity;
    }

    if (capacity >= job->nb_requested_resources)
    {
        allocated = selected;
        return true;
    }

    return false;
}

ContiguousResourceSelector::ContiguousResourceSelector()
{

}

ContiguousResourceSelector::~ContiguousResourceSelector()
{

}

bool ContiguousResourceSelector::fit(const Job *job, const IntervalSet &available, const ClusterState &cluster, IntervalSet &allocated)
{
    for (auto it = available.intervals_begin(); it != available.intervals_end(); ++it)
    {
        IntervalSet selected;
        int capacity = 0;

        for (int host_id = it->lower(); host_id <= (int) it->upper(); ++host_id)
        {
            selected.insert(host_id);
            capacity += cluster[host_id].capacity;

            if (capacity >= job->nb_requested_resources)
            {
                allocated = selected;
                return true;
            }
        }
    }

    return false;
}
