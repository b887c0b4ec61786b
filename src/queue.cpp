#include "queue.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "json_workload.hpp"

using namespace std;

namespace
{
    /**
     * @brief Strict weak order on a key, falling back on the job identifier
     * @param[in] key1 The key of the first job
     * @param[in] key2 The key of the second job
     * @param[in] ascending Whether smaller keys come first
     */
    template <typename Key>
    bool by_key_then_id(const Key & key1, const Key & key2, bool ascending,
                        const SortableJob * j1, const SortableJob * j2)
    {
        if (key1 != key2)
            return ascending ? key1 < key2 : key2 < key1;
        return j1->job->id < j2->job->id;
    }

    // An unbounded walltime is larger than every bounded one
    bool by_walltime(const SortableJob * j1, const SortableJob * j2, bool ascending)
    {
        const Job * a = j1->job;
        const Job * b = j2->job;

        if (a->has_walltime != b->has_walltime)
            return ascending ? a->has_walltime : b->has_walltime;
        if (!a->has_walltime)
            return a->id < b->id;
        return by_key_then_id(a->walltime, b->walltime, ascending, j1, j2);
    }
}

bool FCFSOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_key_then_id(j1->release_date, j2->release_date, true, j1, j2);
}

bool LCFSOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_key_then_id(j1->release_date, j2->release_date, false, j1, j2);
}

bool AscendingSizeOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_key_then_id(j1->job->nb_requested_resources, j2->job->nb_requested_resources, true, j1, j2);
}

bool DescendingSizeOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_key_then_id(j1->job->nb_requested_resources, j2->job->nb_requested_resources, false, j1, j2);
}

bool AscendingWalltimeOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_walltime(j1, j2, true);
}

bool DescendingWalltimeOrder::compare(const SortableJob *j1, const SortableJob *j2) const
{
    return by_walltime(j1, j2, false);
}


Queue::Queue(SortableJobOrder *order) :
    _order(order)
{
    if (_order == nullptr)
        throw std::invalid_argument("A queue needs an order");
}

Queue::~Queue()
{
    for (SortableJob * sjob : _jobs)
        delete sjob;
    _jobs.clear();
}

void Queue::append_job(const Job *job)
{
    SortableJob * entry = new SortableJob;
    entry->job = job;
    entry->release_date = Rational(job->submission_time);

    // Insertion keeps the list sorted, before the first entry the new one precedes
    iterator position = _jobs.begin();
    while (position != _jobs.end() && !_order->compare(entry, *position))
        ++position;
    _jobs.insert(position, entry);
}

void Queue::remove_job(const Job *job)
{
    iterator entry_it = find(job);
    if (entry_it == _jobs.end())
        throw std::logic_error("Cannot remove job '" + job->id + "': not in the queue");

    delete *entry_it;
    _jobs.erase(entry_it);
}

bool Queue::contains_job(const Job *job) const
{
    return std::any_of(_jobs.begin(), _jobs.end(),
                       [job](const SortableJob * entry) { return entry->job == job; });
}

Queue::iterator Queue::find(const Job *job)
{
    return std::find_if(_jobs.begin(), _jobs.end(),
                        [job](const SortableJob * entry) { return entry->job == job; });
}

const Job* Queue::first_job() const
{
    if (_jobs.empty())
        throw std::logic_error("No first job: Queue is empty");
    return _jobs.front()->job;
}

int Queue::nb_jobs() const
{
    return (int) _jobs.size();
}

std::string Queue::to_string() const
{
    vector<string> ids;
    ids.reserve(_jobs.size());

    for (const SortableJob * entry : _jobs)
        ids.push_back(entry->job->id);

    return "[" + boost::algorithm::join(ids, ", ") + "]";
}
