#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "json_workload.hpp"
#include "locality.hpp"
#include "machine.hpp"
#include "schedule.hpp"

using namespace std;

class ScheduleTest : public ::testing::Test
{
protected:
    ScheduleTest() : cluster(0, 1)
    {
        for (int id = 0; id < 4; ++id)
            cluster.add_host(id, "host" + std::to_string(id), 1, PowerState::IDLE, 0);
    }

    const Job * job(const string & job_id, int nb_resources, double walltime)
    {
        return workload.add_job_from_json_description_string("{\"res\":" + std::to_string(nb_resources) +
                                                             ",\"walltime\":" + std::to_string(walltime) + "}",
                                                             job_id, 0);
    }

    Workload workload;
    ClusterState cluster;
    BasicResourceSelector basic;
    ContiguousResourceSelector contiguous;
};

TEST_F(ScheduleTest, job_starts_when_enough_hosts_are_ready)
{
    Schedule schedule(10);
    schedule.add_host(0, 10);
    schedule.add_host(1, 30);
    schedule.add_host(2, 20);
    schedule.add_host(3, 5);

    JobAlloc alloc = schedule.add_job_first_fit(job("w0!1", 3, 50), cluster, &basic);
    ASSERT_TRUE(alloc.has_been_inserted);
    EXPECT_EQ(alloc.begin, Rational(20));
    EXPECT_EQ(alloc.end, Rational(70));
    EXPECT_EQ(alloc.used_machines.to_string_hyphen(" ", "-"), "0 2-3");

    EXPECT_TRUE(schedule.is_reserved(2, 60, 80));
    EXPECT_FALSE(schedule.is_reserved(1, 0, 100));
    EXPECT_EQ(schedule.candidate_dates(), vector<Rational>({Rational(10), Rational(20), Rational(30), Rational(70)}));
}

TEST_F(ScheduleTest, backfilled_job_fits_before_a_reservation)
{
    Schedule schedule(0);
    for (int id = 0; id < 4; ++id)
        schedule.add_host(id, id < 2 ? 100 : 0);

    JobAlloc big = schedule.add_job_first_fit(job("w0!1", 4, 100), cluster, &basic);
    EXPECT_EQ(big.begin, Rational(100));

    JobAlloc fits = schedule.add_job_first_fit(job("w0!2", 2, 100), cluster, &basic);
    EXPECT_EQ(fits.begin, Rational(0));
    EXPECT_EQ(fits.used_machines.to_string_hyphen(" ", "-"), "2-3");

    JobAlloc too_long = schedule.add_job_first_fit(job("w0!3", 1, 150), cluster, &basic);
    EXPECT_EQ(too_long.begin, Rational(200));

    EXPECT_EQ(schedule.machines_reserved_before(50).to_string_hyphen(" ", "-"), "2-3");
    EXPECT_EQ(schedule.machines_reserved_before(101).to_string_hyphen(" ", "-"), "0-3");
}

TEST_F(ScheduleTest, unreachable_hosts_are_never_used)
{
    Schedule schedule(0);
    schedule.add_host(0, 0);
    schedule.add_host(1, schedule.infinite_horizon());

    JobAlloc alloc = schedule.find_earliest_fit(job("w0!1", 2, 10), cluster, &basic);
    EXPECT_FALSE(alloc.has_been_inserted);
    EXPECT_THROW(schedule.reserve(alloc), invalid_argument);
}

TEST_F(ScheduleTest, overlapping_reservation_is_refused)
{
    Schedule schedule(0);
    schedule.add_host(0, 0);

    JobAlloc first = schedule.add_job_first_fit(job("w0!1", 1, 10), cluster, &basic);
    JobAlloc second = first;
    second.job = job("w0!2", 1, 10);

    EXPECT_THROW(schedule.reserve(second), invalid_argument);
    EXPECT_THROW(schedule.add_host(0, 0), invalid_argument);
}

TEST_F(ScheduleTest, contiguous_selection)
{
    IntervalSet available = IntervalSet::from_string_hyphen("0 2-3", " ");
    IntervalSet allocated;

    EXPECT_TRUE(contiguous.fit(job("w0!1", 2, 10), available, cluster, allocated));
    EXPECT_EQ(allocated.to_string_hyphen(" ", "-"), "2-3");

    EXPECT_FALSE(contiguous.fit(job("w0!2", 3, 10), available, cluster, allocated));
    EXPECT_TRUE(basic.fit(job("w0!3", 3, 10), available, cluster, allocated));
    EXPECT_EQ(allocated.to_string_hyphen(" ", "-"), "0 2-3");
}

TEST_F(ScheduleTest, selection_counts_host_capacity)
{
    ClusterState multi_slot(0, 1);
    multi_slot.add_host(0, "fat", 4, PowerState::IDLE, 0);
    multi_slot.add_host(1, "thin", 1, PowerState::IDLE, 0);

    IntervalSet allocated;
    EXPECT_TRUE(basic.fit(job("w0!1", 3, 10), multi_slot.all_hosts(), multi_slot, allocated));
    EXPECT_EQ(allocated.to_string_hyphen(" ", "-"), "0");
    EXPECT_TRUE(basic.fit(job("w0!2", 5, 10), multi_slot.all_hosts(), multi_slot, allocated));
    EXPECT_EQ(allocated.to_string_hyphen(" ", "-"), "0-1");
    EXPECT_FALSE(basic.fit(job("w0!3", 6, 10), multi_slot.all_hosts(), multi_slot, allocated));
}
