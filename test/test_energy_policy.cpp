#include <gtest/gtest.h>

#include "energy_policy.hpp"
#include "machine.hpp"

namespace
{
    const int PSTATE_COMPUTE = 0;
    const int PSTATE_SLEEP = 1;
}

class EnergyPolicyTest : public ::testing::Test
{
protected:
    EnergyPolicyTest() : cluster(PSTATE_COMPUTE, PSTATE_SLEEP, 1, 1), policy(100, 600)
    {
        for (int id = 0; id < 3; ++id)
            cluster.add_host(id, "host" + std::to_string(id), 1, PowerState::IDLE, 0);
    }

    ClusterState cluster;
    EnergyPolicy policy;
};

TEST_F(EnergyPolicyTest, idle_hosts_sleep_after_the_threshold)
{
    EXPECT_TRUE(policy.evaluate(cluster, IntervalSet(), 99).is_empty());
    EXPECT_DOUBLE_EQ(policy.next_evaluation_date(cluster, IntervalSet(), 99), 100);

    IntervalSet to_sedate = policy.evaluate(cluster, IntervalSet(), 100);
    EXPECT_EQ(to_sedate.to_string_hyphen(" ", "-"), "0-2");
}

TEST_F(EnergyPolicyTest, reserved_and_busy_hosts_stay_awake)
{
    cluster.assign_job("w0!1", IntervalSet(0), 0);

    IntervalSet to_sedate = policy.evaluate(cluster, IntervalSet(1), 500);
    EXPECT_EQ(to_sedate.to_string_hyphen(" ", "-"), "2");
}

TEST_F(EnergyPolicyTest, woken_host_is_under_hysteresis_until_it_runs_a_job)
{
    cluster.request_power_off(IntervalSet(0), 0);
    cluster.apply_state_changed(IntervalSet(0), PSTATE_SLEEP, 1);
    cluster.request_power_on(IntervalSet(0), 50);
    cluster.apply_state_changed(IntervalSet(0), PSTATE_COMPUTE, 51);

    const Host & host = cluster[0];
    EXPECT_TRUE(policy.is_under_hysteresis(host, 200));
    EXPECT_DOUBLE_EQ(policy.sleep_eligibility_date(host), 651);
    EXPECT_TRUE(policy.evaluate(cluster, IntervalSet(IntervalSet::ClosedInterval(1, 2)), 300).is_empty());
    EXPECT_DOUBLE_EQ(policy.next_evaluation_date(cluster, IntervalSet(IntervalSet::ClosedInterval(1, 2)), 300), 651);
    EXPECT_FALSE(policy.evaluate(cluster, IntervalSet(IntervalSet::ClosedInterval(1, 2)), 651).is_empty());

    // Running a job lifts the hysteresis: the idle threshold applies again
    cluster.assign_job("w0!1", IntervalSet(0), 60);
    cluster.release_job("w0!1", IntervalSet(0), 70);
    EXPECT_FALSE(policy.is_under_hysteresis(host, 200));
    EXPECT_DOUBLE_EQ(policy.sleep_eligibility_date(host), 170);
}

TEST_F(EnergyPolicyTest, disabled_policy_never_sleeps)
{
    EnergyPolicy disabled(0, 0, false);

    EXPECT_FALSE(disabled.enabled());
    EXPECT_TRUE(disabled.evaluate(cluster, IntervalSet(), 1000).is_empty());
    EXPECT_DOUBLE_EQ(disabled.next_evaluation_date(cluster, IntervalSet(), 1000), -1);
}
