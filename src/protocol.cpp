#include "protocol.hpp"

#include <stdexcept>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "errors.hpp"
#include "powersched_tools.hpp"

using namespace rapidjson;
using namespace std;
using powersched_tools::string_format;

JsonProtocolWriter::JsonProtocolWriter() :
    _alloc(_doc.GetAllocator())
{
    _doc.SetObject();
}

JsonProtocolWriter::~JsonProtocolWriter()
{

}

void JsonProtocolWriter::check_date(double date)
{
    if (date < _last_date)
        throw logic_error(string_format("Date inconsistency: %g is before the last appended date %g", date, _last_date));
    _last_date = date;
    _is_empty = false;
}

void JsonProtocolWriter::push_event(const char * type, Value & data, double date)
{
    Value event(rapidjson::kObjectType);
    event.AddMember("timestamp", Value().SetDouble(date), _alloc);
    event.AddMember("type", Value().SetString(type, _alloc), _alloc);
    event.AddMember("data", data, _alloc);

    _events.PushBack(event, _alloc);
}

void JsonProtocolWriter::append_execute_job(const string &job_id,
                                            const IntervalSet &allocated_resources,
                                            double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("job_id", Value().SetString(job_id.c_str(), _alloc), _alloc);
    data.AddMember("alloc", Value().SetString(allocated_resources.to_string_hyphen(" ", "-").c_str(), _alloc), _alloc);

    push_event("EXECUTE_JOB", data, date);
}

void JsonProtocolWriter::append_reject_job(const string &job_id,
                                           double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("job_id", Value().SetString(job_id.c_str(), _alloc), _alloc);

    push_event("REJECT_JOB", data, date);
}

void JsonProtocolWriter::append_set_resource_state(const IntervalSet &resources,
                                                   const string &new_state,
                                                   double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("resources", Value().SetString(resources.to_string_hyphen(" ", "-").c_str(), _alloc), _alloc);
    data.AddMember("state", Value().SetString(new_state.c_str(), _alloc), _alloc);

    push_event("SET_RESOURCE_STATE", data, date);
}

void JsonProtocolWriter::append_call_me_later(double future_date,
                                              double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("timestamp", Value().SetDouble(future_date), _alloc);

    push_event("CALL_ME_LATER", data, date);
}

void JsonProtocolWriter::append_query_consumed_energy(double date)
{
    check_date(date);

    Value requests(rapidjson::kObjectType);
    requests.AddMember("consumed_energy", Value().SetObject(), _alloc);

    Value data(rapidjson::kObjectType);
    data.AddMember("requests", requests, _alloc);

    push_event("QUERY", data, date);
}

void JsonProtocolWriter::append_simulation_begins(int nb_resources, double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("nb_resources", Value().SetInt(nb_resources), _alloc);

    push_event("SIMULATION_BEGINS", data, date);
}

void JsonProtocolWriter::append_simulation_begins(const string &compute_resources_json, double date)
{
    Document resources_doc;
    resources_doc.Parse(compute_resources_json.c_str());
    if (resources_doc.HasParseError() || !resources_doc.IsArray())
        throw invalid_argument("Invalid JSON compute resources ###" + compute_resources_json + "###");

    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("nb_resources", Value().SetInt((int) resources_doc.Size()), _alloc);
    data.AddMember("compute_resources", Value().CopyFrom(resources_doc, _alloc), _alloc);

    push_event("SIMULATION_BEGINS", data, date);
}

void JsonProtocolWriter::append_simulation_ends(double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    push_event("SIMULATION_ENDS", data, date);
}

void JsonProtocolWriter::append_job_submitted(const string &job_id,
                                              const string &job_description,
                                              double date)
{
    Document job_doc;
    job_doc.Parse(job_description.c_str());
    if (job_doc.HasParseError())
        throw invalid_argument("Invalid JSON job ###" + job_description + "###");

    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("job_id", Value().SetString(job_id.c_str(), _alloc), _alloc);
    data.AddMember("job", Value().CopyFrom(job_doc, _alloc), _alloc);

    push_event("JOB_SUBMITTED", data, date);
}

void JsonProtocolWriter::append_job_completed(const string &job_id,
                                              const string &job_status,
                                              double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("job_id", Value().SetString(job_id.c_str(), _alloc), _alloc);
    data.AddMember("status", Value().SetString(job_status.c_str(), _alloc), _alloc);

    push_event("JOB_COMPLETED", data, date);
}

void JsonProtocolWriter::append_job_killed(const vector<string> &job_ids,
                                           double date)
{
    check_date(date);

    Value jobs(rapidjson::kArrayType);
    jobs.Reserve(job_ids.size(), _alloc);
    for (const string & job_id : job_ids)
        jobs.PushBack(Value().SetString(job_id.c_str(), _alloc), _alloc);

    Value data(rapidjson::kObjectType);
    data.AddMember("job_ids", jobs, _alloc);

    push_event("JOB_KILLED", data, date);
}

void JsonProtocolWriter::append_resource_state_changed(const IntervalSet &resources,
                                                       const string &new_state,
                                                       double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("resources",
                   Value().SetString(resources.to_string_hyphen(" ", "-").c_str(), _alloc), _alloc);
    data.AddMember("state", Value().SetString(new_state.c_str(), _alloc), _alloc);

    push_event("RESOURCE_STATE_CHANGED", data, date);
}

void JsonProtocolWriter::append_requested_call(double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    push_event("REQUESTED_CALL", data, date);
}

void JsonProtocolWriter::append_answer_energy(double consumed_energy, double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("consumed_energy", Value().SetDouble(consumed_energy), _alloc);

    push_event("ANSWER", data, date);
}

void JsonProtocolWriter::append_notify(const string &notify_type, double date)
{
    check_date(date);

    Value data(rapidjson::kObjectType);
    data.AddMember("type", Value().SetString(notify_type.c_str(), _alloc), _alloc);

    push_event("NOTIFY", data, date);
}

void JsonProtocolWriter::clear()
{
    _is_empty = true;

    _doc.RemoveAllMembers();
    _events.SetArray();
}

string JsonProtocolWriter::generate_current_message(double date)
{
    if (date < _last_date)
        throw logic_error(string_format("Date inconsistency: message dated %g but an event is dated %g", date, _last_date));
    if (!_events.IsArray())
        throw logic_error("Successive calls to JsonProtocolWriter::generate_current_message without calling "
                          "the clear() method is not supported");

    // Generating the content
    _doc.AddMember("now", Value().SetDouble(date), _alloc);
    _doc.AddMember("events", _events, _alloc);

    // Dumping the content to a buffer
    StringBuffer buffer;
    Writer<rapidjson::StringBuffer> writer(buffer);
    _doc.Accept(writer);

    // Returning the buffer as a string
    return string(buffer.GetString(), buffer.GetSize());
}

string to_string(EventType type)
{
    switch (type)
    {
        case EventType::SIMULATION_BEGINS:
            return "SIMULATION_BEGINS";
        case EventType::SIMULATION_ENDS:
            return "SIMULATION_ENDS";
        case EventType::JOB_SUBMITTED:
            return "JOB_SUBMITTED";
        case EventType::JOB_COMPLETED:
            return "JOB_COMPLETED";
        case EventType::JOB_KILLED:
            return "JOB_KILLED";
        case EventType::RESOURCE_STATE_CHANGED:
            return "RESOURCE_STATE_CHANGED";
        case EventType::REQUESTED_CALL:
            return "REQUESTED_CALL";
        case EventType::ANSWER:
            return "ANSWER";
        case EventType::NOTIFY:
            return "NOTIFY";
    }
    return "UNKNOWN";
}

namespace
{
    string json_string(const Value & value)
    {
        StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return string(buffer.GetString(), buffer.GetSize());
    }

    const Value & member(const Value & object, const char * name, const string & context)
    {
        if (!object.HasMember(name))
            throw ProtocolError(context + ": no '" + name + "' member");
        return object[name];
    }

    string string_member(const Value & object, const char * name, const string & context)
    {
        const Value & value = member(object, name, context);
        if (!value.IsString())
            throw ProtocolError(context + ": '" + name + "' member is not a string");
        return value.GetString();
    }
}

EventBatch JsonProtocolReader::parse(const string &message) const
{
    Document doc;
    doc.Parse(message.c_str());

    if (doc.HasParseError())
        throw ProtocolError("Invalid message: not valid JSON ###" + message + "###");
    if (!doc.IsObject())
        throw ProtocolError("Invalid message: not a JSON object");
    if (!doc.HasMember("now") || !doc["now"].IsNumber())
        throw ProtocolError("Invalid message: no numeric 'now' member");
    if (!doc.HasMember("events") || !doc["events"].IsArray())
        throw ProtocolError("Invalid message: no 'events' array");

    EventBatch batch;
    batch.now = doc["now"].GetDouble();

    const Value & events_array = doc["events"];
    for (SizeType event_i = 0; event_i < events_array.Size(); ++event_i)
        batch.events.push_back(parse_event(events_array[event_i], (int) event_i));

    return batch;
}

Event JsonProtocolReader::parse_event(const Value &event_object, int event_index) const
{
    string context = string_format("Invalid event #%d", event_index);

    if (!event_object.IsObject())
        throw ProtocolError(context + ": not an object");
    if (!event_object.HasMember("timestamp") || !event_object["timestamp"].IsNumber())
        throw ProtocolError(context + ": no numeric 'timestamp' member");

    const string event_type = string_member(event_object, "type", context);
    const Value & event_data = member(event_object, "data", context);
    if (!event_data.IsObject())
        throw ProtocolError(context + ": 'data' member is not an object");

    context += " (" + event_type + ")";

    Event event;
    event.timestamp = event_object["timestamp"].GetDouble();

    if (event_type == "SIMULATION_BEGINS")
    {
        event.type = EventType::SIMULATION_BEGINS;
        event.data = json_string(event_data);
    }
    else if (event_type == "SIMULATION_ENDS")
    {
        event.type = EventType::SIMULATION_ENDS;
    }
    else if (event_type == "JOB_SUBMITTED")
    {
        event.type = EventType::JOB_SUBMITTED;
        event.job_id = string_member(event_data, "job_id", context);

        const Value & job_object = member(event_data, "job", context);
        if (!job_object.IsObject())
            throw ProtocolError(context + ": 'job' member is not an object");
        event.job_description = json_string(job_object);
    }
    else if (event_type == "JOB_COMPLETED")
    {
        event.type = EventType::JOB_COMPLETED;
        event.job_id = string_member(event_data, "job_id", context);

        if (event_data.HasMember("status"))
            event.job_status = string_member(event_data, "status", context);
        else if (event_data.HasMember("job_state"))
            event.job_status = string_member(event_data, "job_state", context);
        else
            event.job_status = powersched_tools::job_status::SUCCESS;
    }
    else if (event_type == "JOB_KILLED")
    {
        event.type = EventType::JOB_KILLED;

        if (event_data.HasMember("job_ids"))
        {
            const Value & job_ids = event_data["job_ids"];
            if (!job_ids.IsArray())
                throw ProtocolError(context + ": 'job_ids' member is not an array");

            for (SizeType i = 0; i < job_ids.Size(); ++i)
            {
                if (!job_ids[i].IsString())
                    throw ProtocolError(context + ": 'job_ids' contains a non-string value");
                event.job_ids.push_back(job_ids[i].GetString());
            }
        }
        else if (event_data.HasMember("job_progress"))
        {
            const Value & job_progress = event_data["job_progress"];
            if (!job_progress.IsObject())
                throw ProtocolError(context + ": 'job_progress' member is not an object");

            for (auto itr = job_progress.MemberBegin(); itr != job_progress.MemberEnd(); ++itr)
                event.job_ids.push_back(itr->name.GetString());
        }
        else
            throw ProtocolError(context + ": no 'job_ids' nor 'job_progress' member");
    }
    else if (event_type == "RESOURCE_STATE_CHANGED")
    {
        event.type = EventType::RESOURCE_STATE_CHANGED;

        string resources = string_member(event_data, "resources", context);
        try
        {
            event.resources = IntervalSet::from_string_hyphen(resources, " ");
        }
        catch (const std::exception & e)
        {
            throw ProtocolError(context + ": invalid 'resources' value '" + resources + "': " + e.what());
        }

        const Value & state = member(event_data, "state", context);
        if (state.IsInt())
            event.pstate = state.GetInt();
        else if (state.IsString())
        {
            try
            {
                size_t parsed_length = 0;
                event.pstate = std::stoi(state.GetString(), &parsed_length);
                if (parsed_length != state.GetStringLength())
                    throw ProtocolError(context + ": 'state' value '" + state.GetString() + "' is not an integer");
            }
            catch (const std::logic_error &)
            {
                throw ProtocolError(context + ": 'state' value '" + state.GetString() + "' is not an integer");
            }
        }
        else
            throw ProtocolError(context + ": 'state' member is neither a string nor an integer");
    }
    else if (event_type == "REQUESTED_CALL")
    {
        event.type = EventType::REQUESTED_CALL;
    }
    else if (event_type == "ANSWER")
    {
        event.type = EventType::ANSWER;

        for (auto itr = event_data.MemberBegin(); itr != event_data.MemberEnd(); ++itr)
        {
            string key_value = itr->name.GetString();

            if (key_value == "consumed_energy")
            {
                if (!itr->value.IsNumber())
                    throw ProtocolError(context + ": 'consumed_energy' member is not a number");
                event.consumed_energy = itr->value.GetDouble();
            }
            else
                throw ProtocolError(context + ": unknown ANSWER type '" + key_value + "'");
        }
    }
    else if (event_type == "NOTIFY")
    {
        event.type = EventType::NOTIFY;
        event.notify_type = string_member(event_data, "type", context);
    }
    else
        throw ProtocolError("Unknown event received. Type = " + event_type);

    return event;
}
