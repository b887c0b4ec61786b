#include "json_workload.hpp"

#include <loguru.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "errors.hpp"

using namespace rapidjson;
using namespace std;

Workload::~Workload()
{
    deallocate();
}

Job * Workload::operator[](const string & job_id)
{
    auto it = _jobs.find(job_id);
    if (it == _jobs.end())
        throw ProtocolError("Job '" + job_id + "' does not exist");
    return it->second;
}

const Job * Workload::operator[](const string & job_id) const
{
    auto it = _jobs.find(job_id);
    if (it == _jobs.end())
        throw ProtocolError("Job '" + job_id + "' does not exist");
    return it->second;
}

bool Workload::contains(const string & job_id) const
{
    return _jobs.count(job_id) == 1;
}

int Workload::nb_jobs() const
{
    return (int) _jobs.size();
}

Job * Workload::add_job_from_json_object(const Value & object, const string & job_id, double submission_time)
{
    if (_jobs.count(job_id) != 0)
        throw ProtocolError("Job '" + job_id + "' already exists in the Workload");

    Job * job = job_from_json_object(object);
    job->id = job_id;
    job->submission_time = submission_time;

    _jobs[job_id] = job;
    return job;
}

Job * Workload::add_job_from_json_description_string(const string & json_string, const string & job_id, double submission_time)
{
    Document document;

    if (document.Parse(json_string.c_str()).HasParseError())
        throw ProtocolError("Invalid json string '" + json_string + "'");

    return add_job_from_json_object(document, job_id, submission_time);
}

map<string, Job*> & Workload::get_jobs()
{
    return _jobs;
}

void Workload::deallocate()
{
    // Let's delete all allocated jobs
    for (auto & mit : _jobs)
    {
        delete mit.second;
    }

    _jobs.clear();
}

Job * Workload::job_from_json_object(const Value & object)
{
    if (!object.IsObject())
        throw ProtocolError("Invalid json object: not an object");
    if (!object.HasMember("res"))
        throw ProtocolError("Invalid json object: no 'res' member");
    if (!object["res"].IsInt())
        throw ProtocolError("Invalid json object: 'res' member is not an integer");
    if (object["res"].GetInt() <= 0)
        throw ProtocolError("Invalid json object: 'res' member must be strictly positive");

    Job * j = new Job;
    j->walltime = -1;
    j->has_walltime = true;
    j->nb_requested_resources = object["res"].GetInt();
    j->unique_number = _job_number++;

    if (object.HasMember("walltime"))
    {
        if (!object["walltime"].IsNumber())
        {
            delete j;
            throw ProtocolError("Invalid json object: 'walltime' member is not a number");
        }

        j->walltime = Rational(object["walltime"].GetDouble());
    }

    if (j->walltime != -1 && j->walltime <= 0)
    {
        delete j;
        throw ProtocolError("Invalid json object: 'walltime' should either be -1 (no walltime) "
                            "or strictly positive.");
    }

    if (j->walltime == -1)
        j->has_walltime = false;

    if (object.HasMember("profile"))
    {
        if (!object["profile"].IsString())
        {
            delete j;
            throw ProtocolError("Invalid json object: 'profile' member is not a string");
        }
        j->profile = object["profile"].GetString();
    }

    // Let's get the JSON string which originally described the job
    // (to conserve potential fields unused by the scheduler)
    StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    object.Accept(writer);

    j->json_description = string(buffer.GetString(), buffer.GetSize());

    LOG_F(1, "res=%d, walltime=%g, profile='%s'", j->nb_requested_resources,
          j->walltime.convert_to<double>(), j->profile.c_str());

    return j;
}
