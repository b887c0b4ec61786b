#include <map>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include "errors.hpp"
#include "powersched_tools.hpp"
#include "simulation_loop.hpp"

#include "scripted_network.hpp"

using namespace std;
using powersched_tools::JobState;

namespace
{
    string hosts_string(const IntervalSet & hosts)
    {
        return hosts.to_string_hyphen(" ", "-");
    }

    SchedulerConfig no_power_management()
    {
        SchedulerConfig config;
        config.power_management = false;
        return config;
    }
}

TEST(ScenarioTest, simultaneous_jobs_are_allocated_in_the_same_pass)
{
    SchedulerHarness h;
    h.begin(4);

    h.backend().append_job_submitted("w0!1", job_description(2, 100), 0);
    h.backend().append_job_submitted("w0!2", job_description(1, 100), 0);
    h.backend().append_job_submitted("w0!3", job_description(1, 100), 0);
    vector<Decision> decisions = h.step(0);

    vector<Decision> executions = decisions_of_type(decisions, Decision::Type::EXECUTE_JOB);
    ASSERT_EQ(executions.size(), 3u);
    EXPECT_EQ(executions[0].job_id, "w0!1");
    EXPECT_EQ(hosts_string(executions[0].hosts), "0-1");
    EXPECT_EQ(executions[1].job_id, "w0!2");
    EXPECT_EQ(hosts_string(executions[1].hosts), "2");
    EXPECT_EQ(executions[2].job_id, "w0!3");
    EXPECT_EQ(hosts_string(executions[2].hosts), "3");

    EXPECT_EQ(h.jobs.nb_running(), 3);
    EXPECT_EQ(h.jobs.nb_pending(), 0);
    EXPECT_EQ(h.cluster.nb_hosts_in_state(PowerState::COMPUTING), 4);
}

TEST(ScenarioTest, job_waits_until_the_running_one_completes)
{
    SchedulerHarness h;
    h.begin(2);

    vector<Decision> decisions = h.submit("w0!1", 2, 100, 0);
    ASSERT_EQ(decisions_of_type(decisions, Decision::Type::EXECUTE_JOB).size(), 1u);

    decisions = h.submit("w0!2", 1, 100, 5);
    EXPECT_TRUE(decisions_of_type(decisions, Decision::Type::EXECUTE_JOB).empty());
    EXPECT_EQ(h.jobs.job("w0!2")->state, JobState::PENDING);

    h.backend().append_job_completed("w0!1", powersched_tools::job_status::SUCCESS, 60);
    decisions = h.step(60);

    vector<Decision> executions = decisions_of_type(decisions, Decision::Type::EXECUTE_JOB);
    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].job_id, "w0!2");
    EXPECT_EQ(hosts_string(executions[0].hosts), "0");
    EXPECT_EQ(h.jobs.job("w0!1")->state, JobState::COMPLETED);
    EXPECT_EQ(h.jobs.job("w0!2")->state, JobState::RUNNING);
}

TEST(ScenarioTest, idle_host_sleeps_then_wakes_for_a_job)
{
    SchedulerConfig config;
    config.idle_time_to_sleep = 10;
    config.wake_cooldown = 600;
    config.switch_on_delay = 1;
    config.switch_off_delay = 1;
    SchedulerHarness h(config);

    vector<Decision> decisions = h.begin(1);
    vector<Decision> calls = decisions_of_type(decisions, Decision::Type::CALL_ME_LATER);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_DOUBLE_EQ(calls[0].future_date, 10);

    h.backend().append_requested_call(10);
    decisions = h.step(10);
    vector<Decision> state_changes = decisions_of_type(decisions, Decision::Type::SET_RESOURCE_STATE);
    ASSERT_EQ(state_changes.size(), 1u);
    EXPECT_EQ(state_changes[0].pstate, config.pstate_sleep);
    EXPECT_EQ(hosts_string(state_changes[0].hosts), "0");
    EXPECT_EQ(h.cluster[0].state, PowerState::SWITCHING_OFF);

    h.backend().append_resource_state_changed(IntervalSet(0), std::to_string(config.pstate_sleep), 11);
    h.step(11);
    EXPECT_EQ(h.cluster[0].state, PowerState::SLEEPING);

    // The job needs the sleeping host: it is woken up, not allocated yet
    decisions = h.submit("w0!1", 1, 100, 20);
    EXPECT_TRUE(decisions_of_type(decisions, Decision::Type::EXECUTE_JOB).empty());
    state_changes = decisions_of_type(decisions, Decision::Type::SET_RESOURCE_STATE);
    ASSERT_EQ(state_changes.size(), 1u);
    EXPECT_EQ(state_changes[0].pstate, config.pstate_compute);
    EXPECT_EQ(h.cluster[0].state, PowerState::SWITCHING_ON);

    h.backend().append_resource_state_changed(IntervalSet(0), std::to_string(config.pstate_compute), 21);
    decisions = h.step(21);
    vector<Decision> executions = decisions_of_type(decisions, Decision::Type::EXECUTE_JOB);
    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].job_id, "w0!1");
    EXPECT_TRUE(decisions_of_type(decisions, Decision::Type::SET_RESOURCE_STATE).empty());

    // Right after the job, the host is not switched off again
    h.backend().append_job_completed("w0!1", powersched_tools::job_status::SUCCESS, 121);
    decisions = h.step(121);
    EXPECT_TRUE(decisions_of_type(decisions, Decision::Type::SET_RESOURCE_STATE).empty());
    EXPECT_EQ(h.cluster[0].state, PowerState::IDLE);
}

TEST(ScenarioTest, infeasible_job_is_rejected_immediately)
{
    SchedulerHarness h(no_power_management());
    h.begin(4);

    vector<Decision> decisions = h.submit("w0!1", 10, 100, 0);

    vector<Decision> rejections = decisions_of_type(decisions, Decision::Type::REJECT_JOB);
    ASSERT_EQ(rejections.size(), 1u);
    EXPECT_EQ(rejections[0].job_id, "w0!1");
    EXPECT_EQ(rejections[0].reason, "InfeasibleRequest");
    EXPECT_EQ(h.jobs.job("w0!1")->state, JobState::REJECTED);
    EXPECT_EQ(h.jobs.nb_pending(), 0);
}

TEST(ScenarioTest, infeasible_job_is_rejected_under_load)
{
    SchedulerHarness h(no_power_management());
    h.begin(4);
    h.submit("w0!1", 4, 100, 0);

    vector<Decision> decisions = h.submit("w0!2", 10, 100, 1);

    ASSERT_EQ(decisions_of_type(decisions, Decision::Type::REJECT_JOB).size(), 1u);
    EXPECT_EQ(h.jobs.nb_rejected(), 1);
    EXPECT_EQ(h.jobs.nb_running(), 1);
}

TEST(ScenarioTest, no_host_is_double_booked)
{
    SchedulerHarness h(no_power_management());
    h.begin(6);

    // A small backend: jobs end at start + walltime
    const vector<int> sizes = {3, 2, 4, 1, 6, 2, 5, 1, 3, 2};
    const vector<double> walltimes = {40, 15, 30, 70, 20, 35, 10, 50, 25, 5};
    multimap<double, string> ends;
    double now = 0;

    for (unsigned int i = 0; i < sizes.size(); ++i)
        h.backend().append_job_submitted("w0!" + std::to_string(i), job_description(sizes[i], walltimes[i]), 0);

    vector<Decision> decisions = h.step(0);

    while (true)
    {
        for (const Decision & execution : decisions_of_type(decisions, Decision::Type::EXECUTE_JOB))
        {
            const Job * job = h.jobs.job(execution.job_id);
            EXPECT_GE(h.cluster.capacity_of(execution.hosts), job->nb_requested_resources);
            ends.insert({now + job->walltime.convert_to<double>(), execution.job_id});
        }

        map<int, string> owners;
        for (const string & job_id : h.jobs.running_jobs())
        {
            const IntervalSet & allocation = h.jobs.job(job_id)->allocation;
            for (auto host_it = allocation.elements_begin(); host_it != allocation.elements_end(); ++host_it)
            {
                EXPECT_EQ(owners.count(*host_it), 0u) << "host " << *host_it << " runs " << owners[*host_it]
                                                       << " and " << job_id;
                owners[*host_it] = job_id;
            }
        }

        if (ends.empty())
            break;

        now = ends.begin()->first;
        while (!ends.empty() && ends.begin()->first == now)
        {
            h.backend().append_job_completed(ends.begin()->second, powersched_tools::job_status::SUCCESS, now);
            ends.erase(ends.begin());
        }
        decisions = h.step(now);
    }

    EXPECT_EQ(h.jobs.nb_completed(), (int) sizes.size());
    EXPECT_EQ(h.jobs.nb_pending(), 0);
}

TEST(ScenarioTest, replaying_a_run_gives_the_same_replies)
{
    vector<string> messages;
    JsonProtocolWriter backend;

    backend.append_simulation_begins(4, 0);
    messages.push_back(backend.generate_current_message(0));
    backend.clear();

    backend.append_job_submitted("w0!1", job_description(2, 100), 0);
    backend.append_job_submitted("w0!2", job_description(3, 50), 0);
    backend.append_job_submitted("w0!3", job_description(1, 20), 0);
    messages.push_back(backend.generate_current_message(0));
    backend.clear();

    backend.append_job_completed("w0!3", powersched_tools::job_status::SUCCESS, 20);
    messages.push_back(backend.generate_current_message(20));
    backend.clear();

    backend.append_job_completed("w0!1", powersched_tools::job_status::SUCCESS, 100);
    backend.append_notify("no_more_static_job_to_submit", 100);
    messages.push_back(backend.generate_current_message(100));
    backend.clear();

    backend.append_simulation_ends(200);
    messages.push_back(backend.generate_current_message(200));
    backend.clear();

    SchedulerHarness first(no_power_management());
    SchedulerHarness second(no_power_management());

    for (const string & message : messages)
    {
        first.network.push_message(message);
        second.network.push_message(message);
    }

    run(first.transport, first.algo, first.decision, first.workload);
    run(second.transport, second.algo, second.decision, second.workload);

    ASSERT_EQ(first.network.sent_messages().size(), messages.size());
    EXPECT_EQ(first.network.sent_messages(), second.network.sent_messages());
    EXPECT_EQ(first.cluster.to_json_string(), second.cluster.to_json_string());
    EXPECT_TRUE(first.transport.simulation_ended());

    // w0!2 starts when w0!1 ends
    EXPECT_EQ(first.jobs.job("w0!2")->state, JobState::RUNNING);
    EXPECT_DOUBLE_EQ(first.jobs.job("w0!2")->start, 100);

    rapidjson::Document last_reply;
    last_reply.Parse(first.network.sent_messages().back().c_str());
    ASSERT_TRUE(last_reply.IsObject());
    EXPECT_EQ(last_reply["events"].Size(), 0u);
}

TEST(ScenarioTest, run_stops_on_a_lost_connection)
{
    SchedulerHarness h;
    JsonProtocolWriter backend;
    backend.append_simulation_begins(2, 0);
    h.network.push_message(backend.generate_current_message(0));

    EXPECT_THROW(run(h.transport, h.algo, h.decision, h.workload), ProtocolError);
    EXPECT_EQ(h.network.sent_messages().size(), 1u);
}

TEST(ScenarioTest, killed_job_frees_its_hosts)
{
    SchedulerHarness h(no_power_management());
    h.begin(2);
    h.submit("w0!1", 2, 100, 0);
    h.submit("w0!2", 2, 100, 1);

    h.backend().append_job_killed({"w0!1"}, 30);
    vector<Decision> decisions = h.step(30);

    EXPECT_EQ(h.jobs.job("w0!1")->completion_status, powersched_tools::job_status::KILLED);
    vector<Decision> executions = decisions_of_type(decisions, Decision::Type::EXECUTE_JOB);
    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].job_id, "w0!2");
}
