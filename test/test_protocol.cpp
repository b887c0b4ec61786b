#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include "decision.hpp"
#include "errors.hpp"
#include "protocol.hpp"

using namespace std;

namespace
{
    EventBatch parse(const string & message)
    {
        JsonProtocolReader reader;
        return reader.parse(message);
    }

    string single_event(const string & type, const string & data, double timestamp = 1)
    {
        return "{\"now\":" + std::to_string(timestamp) + ",\"events\":[{\"timestamp\":" + std::to_string(timestamp) +
               ",\"type\":\"" + type + "\",\"data\":" + data + "}]}";
    }
}

TEST(JsonProtocolReaderTest, backend_events)
{
    EventBatch batch = parse("{\"now\": 12.5, \"events\": ["
        "{\"timestamp\": 10, \"type\": \"JOB_SUBMITTED\", \"data\": {\"job_id\": \"w0!1\", \"job\": {\"res\": 2, \"walltime\": 50}}},"
        "{\"timestamp\": 11, \"type\": \"JOB_COMPLETED\", \"data\": {\"job_id\": \"w0!0\", \"job_state\": \"COMPLETED_FAILED\"}},"
        "{\"timestamp\": 11, \"type\": \"RESOURCE_STATE_CHANGED\", \"data\": {\"resources\": \"0-2 5\", \"state\": \"13\"}},"
        "{\"timestamp\": 12, \"type\": \"JOB_KILLED\", \"data\": {\"job_progress\": {\"w0!3\": {\"progress\": 0.5}}}},"
        "{\"timestamp\": 12, \"type\": \"ANSWER\", \"data\": {\"consumed_energy\": 1500.25}},"
        "{\"timestamp\": 12.5, \"type\": \"NOTIFY\", \"data\": {\"type\": \"no_more_static_job_to_submit\"}}]}");

    EXPECT_DOUBLE_EQ(batch.now, 12.5);
    ASSERT_EQ(batch.events.size(), 6u);

    EXPECT_EQ(batch.events[0].type, EventType::JOB_SUBMITTED);
    EXPECT_EQ(batch.events[0].job_id, "w0!1");
    rapidjson::Document job;
    job.Parse(batch.events[0].job_description.c_str());
    EXPECT_EQ(job["res"].GetInt(), 2);

    EXPECT_EQ(batch.events[1].job_status, "COMPLETED_FAILED");

    EXPECT_EQ(batch.events[2].pstate, 13);
    EXPECT_EQ(batch.events[2].resources.to_string_hyphen(" ", "-"), "0-2 5");

    ASSERT_EQ(batch.events[3].job_ids.size(), 1u);
    EXPECT_EQ(batch.events[3].job_ids[0], "w0!3");

    EXPECT_DOUBLE_EQ(batch.events[4].consumed_energy, 1500.25);
    EXPECT_EQ(batch.events[5].notify_type, "no_more_static_job_to_submit");
}

TEST(JsonProtocolReaderTest, completion_status_defaults_to_success)
{
    EventBatch batch = parse(single_event("JOB_COMPLETED", "{\"job_id\": \"w0!1\"}"));
    EXPECT_EQ(batch.events[0].job_status, "SUCCESS");
}

TEST(JsonProtocolReaderTest, integral_pstate)
{
    EventBatch batch = parse(single_event("RESOURCE_STATE_CHANGED", "{\"resources\": \"3\", \"state\": 1}"));
    EXPECT_EQ(batch.events[0].pstate, 1);
}

TEST(JsonProtocolReaderTest, malformed_messages)
{
    EXPECT_THROW(parse("not json"), ProtocolError);
    EXPECT_THROW(parse("[]"), ProtocolError);
    EXPECT_THROW(parse("{\"events\": []}"), ProtocolError);
    EXPECT_THROW(parse("{\"now\": 1}"), ProtocolError);
    EXPECT_THROW(parse("{\"now\": 1, \"events\": [{\"type\": \"REQUESTED_CALL\", \"data\": {}}]}"), ProtocolError);
    EXPECT_THROW(parse(single_event("JOB_EXPLODED", "{}")), ProtocolError);
    EXPECT_THROW(parse(single_event("JOB_SUBMITTED", "{\"job_id\": \"w0!1\"}")), ProtocolError);
    EXPECT_THROW(parse(single_event("JOB_COMPLETED", "{\"job_id\": 3}")), ProtocolError);
    EXPECT_THROW(parse(single_event("JOB_KILLED", "{}")), ProtocolError);
    EXPECT_THROW(parse(single_event("RESOURCE_STATE_CHANGED", "{\"resources\": \"0\", \"state\": \"on\"}")), ProtocolError);
    EXPECT_THROW(parse(single_event("RESOURCE_STATE_CHANGED", "{\"resources\": \"0\", \"state\": \"1x\"}")), ProtocolError);
    EXPECT_THROW(parse(single_event("ANSWER", "{\"air_temperature\": 20}")), ProtocolError);
    EXPECT_THROW(parse(single_event("NOTIFY", "{}")), ProtocolError);
}

TEST(JsonProtocolWriterTest, scheduler_decisions)
{
    JsonProtocolWriter writer;
    EXPECT_TRUE(writer.is_empty());

    IntervalSet hosts = IntervalSet::from_string_hyphen("0-1 3", " ");
    writer.append_execute_job("w0!1", hosts, 10);
    writer.append_set_resource_state(IntervalSet(2), "1", 10);
    writer.append_call_me_later(40, 10);
    writer.append_reject_job("w0!2", 11);
    writer.append_query_consumed_energy(11);
    EXPECT_FALSE(writer.is_empty());
    EXPECT_DOUBLE_EQ(writer.last_date(), 11);

    rapidjson::Document doc;
    doc.Parse(writer.generate_current_message(12).c_str());
    ASSERT_TRUE(doc.IsObject());
    EXPECT_DOUBLE_EQ(doc["now"].GetDouble(), 12);

    const rapidjson::Value & events = doc["events"];
    ASSERT_EQ(events.Size(), 5u);
    EXPECT_STREQ(events[0]["type"].GetString(), "EXECUTE_JOB");
    EXPECT_STREQ(events[0]["data"]["alloc"].GetString(), "0-1 3");
    EXPECT_STREQ(events[1]["data"]["state"].GetString(), "1");
    EXPECT_DOUBLE_EQ(events[2]["data"]["timestamp"].GetDouble(), 40);
    EXPECT_STREQ(events[3]["type"].GetString(), "REJECT_JOB");
    EXPECT_TRUE(events[4]["data"]["requests"].HasMember("consumed_energy"));

    writer.clear();
    EXPECT_TRUE(writer.is_empty());
    doc.Parse(writer.generate_current_message(12).c_str());
    EXPECT_EQ(doc["events"].Size(), 0u);
}

TEST(JsonProtocolWriterTest, dates_cannot_decrease)
{
    JsonProtocolWriter writer;
    writer.append_requested_call(10);

    EXPECT_THROW(writer.append_requested_call(9), logic_error);
    EXPECT_THROW(writer.generate_current_message(5), logic_error);
}

TEST(SchedulingDecisionTest, call_me_later_requests_are_not_duplicated)
{
    SchedulingDecision decision;

    EXPECT_TRUE(decision.add_call_me_later(100, 0));
    EXPECT_FALSE(decision.add_call_me_later(100, 5));
    EXPECT_TRUE(decision.add_call_me_later(200, 5));
    EXPECT_TRUE(decision.call_me_later_requested(100));
    EXPECT_EQ(decision.decisions().size(), 2u);

    decision.add_reject_job("w0!1", "InfeasibleRequest", 6);
    EXPECT_EQ(decision.decisions().back().reason, "InfeasibleRequest");
    EXPECT_DOUBLE_EQ(decision.last_date(), 6);

    decision.clear();
    EXPECT_TRUE(decision.is_empty());
    EXPECT_TRUE(decision.decisions().empty());
}
