#include "machine.hpp"

#include <loguru.hpp>
#include <string>

#include "errors.hpp"
#include "powersched_tools.hpp"

using namespace std;
using powersched_tools::string_format;

std::string to_string(PowerState state)
{
    switch (state)
    {
        case PowerState::IDLE:
            return "idle";
        case PowerState::COMPUTING:
            return "computing";
        case PowerState::SWITCHING_ON:
            return "switching_on";
        case PowerState::SWITCHING_OFF:
            return "switching_off";
        case PowerState::SLEEPING:
            return "sleeping";
    }
    return "unknown";
}

std::string Host::to_json_string() const
{
    return string_format("{\"id\":%d,\"name\":\"%s\",\"capacity\":%d,\"state\":\"%s\",\"job\":\"%s\",\"transition_deadline\":%g}",
                         id, name.c_str(), capacity, ::to_string(state).c_str(), job_id.c_str(), transition_deadline);
}

ClusterState::ClusterState(int pstate_compute, int pstate_sleep,
                           double switch_on_delay, double switch_off_delay) :
    _pstate_compute(pstate_compute),
    _pstate_sleep(pstate_sleep),
    _switch_on_delay(switch_on_delay),
    _switch_off_delay(switch_off_delay)
{

}

void ClusterState::ingest_topology(const rapidjson::Value & data, double date)
{
    if (!data.IsObject())
        throw ProtocolError("Invalid SIMULATION_BEGINS data: not an object");

    if (data.HasMember("compute_resources"))
    {
        const rapidjson::Value & resources = data["compute_resources"];
        if (!resources.IsArray())
            throw ProtocolError("Invalid SIMULATION_BEGINS data: 'compute_resources' is not an array");

        for (rapidjson::SizeType i = 0; i < resources.Size(); ++i)
        {
            const rapidjson::Value & object = resources[i];
            if (!object.IsObject() || !object.HasMember("id") || !object["id"].IsInt())
                throw ProtocolError(string_format("Invalid compute resource #%d: no integral 'id'", (int) i));

            int id = object["id"].GetInt();
            string name = string_format("host%d", id);
            if (object.HasMember("name") && object["name"].IsString())
                name = object["name"].GetString();

            PowerState initial_state = PowerState::IDLE;
            if (object.HasMember("state") && object["state"].IsString() &&
                string(object["state"].GetString()) == "sleeping")
                initial_state = PowerState::SLEEPING;

            // Platforms may describe multi-slot hosts through a 'slots' property
            int capacity = 1;
            if (object.HasMember("properties") && object["properties"].IsObject() &&
                object["properties"].HasMember("slots"))
            {
                const rapidjson::Value & slots = object["properties"]["slots"];
                try
                {
                    if (slots.IsInt())
                        capacity = slots.GetInt();
                    else if (slots.IsString())
                        capacity = std::stoi(slots.GetString());
                    else
                        throw ProtocolError(string_format("Invalid 'slots' property of host %d", id));
                }
                catch (const std::logic_error & e)
                {
                    throw ProtocolError(string_format("Invalid 'slots' property of host %d: %s", id, e.what()));
                }
            }

            add_host(id, name, capacity, initial_state, date);
        }
    }
    else
    {
        int nb_resources;
        // nb_compute_resources is what recent backends send, nb_resources what older ones do
        if (data.HasMember("nb_compute_resources") && data["nb_compute_resources"].IsInt())
            nb_resources = data["nb_compute_resources"].GetInt();
        else if (data.HasMember("nb_resources") && data["nb_resources"].IsInt())
            nb_resources = data["nb_resources"].GetInt();
        else
            throw ProtocolError("Invalid SIMULATION_BEGINS data: no 'compute_resources' nor 'nb_resources'");

        for (int id = 0; id < nb_resources; ++id)
            add_host(id, string_format("host%d", id), 1, PowerState::IDLE, date);
    }

    if (_hostsById.empty())
        throw ProtocolError("Invalid SIMULATION_BEGINS data: the platform has no compute resource");

    LOG_F(INFO, "Cluster of %d hosts, total capacity %d", nb_hosts(), _total_capacity);
}

void ClusterState::add_host(int id, const string & name, int capacity, PowerState initial_state, double date)
{
    if (_hostsById.count(id) != 0)
        throw ProtocolError(string_format("Host %d is described twice", id));
    if (id < 0)
        throw ProtocolError(string_format("Invalid host id %d", id));
    if (capacity <= 0)
        throw ProtocolError(string_format("Host %d has a non-positive capacity (%d)", id, capacity));
    if (initial_state != PowerState::IDLE && initial_state != PowerState::SLEEPING)
        throw InvalidTransition(string_format("Host %d cannot start in state %s", id, ::to_string(initial_state).c_str()));

    Host new_host;
    new_host.id = id;
    new_host.name = name;
    new_host.capacity = capacity;
    new_host.state = initial_state;
    new_host.idle_since = date;

    _hostsById[id] = new_host;
    _total_capacity += capacity;
}

void ClusterState::apply_state_changed(const IntervalSet & hosts, int new_pstate, double date)
{
    if (new_pstate != _pstate_compute && new_pstate != _pstate_sleep)
        throw ProtocolError(string_format("Unexpected pstate %d for hosts %s (compute=%d, sleep=%d)",
                                          new_pstate, hosts.to_string_brackets().c_str(),
                                          _pstate_compute, _pstate_sleep));
    check_hosts_exist(hosts);

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        Host & h = host(*host_it);
        if (new_pstate == _pstate_compute)
            on_compute_pstate(h, date);
        else
            on_sleep_pstate(h, date);
    }
}

void ClusterState::on_compute_pstate(Host & h, double date)
{
    switch (h.state)
    {
        case PowerState::SWITCHING_ON:
            break;
        case PowerState::IDLE:
        case PowerState::COMPUTING:
            LOG_F(1, "Host %d already in the compute pstate", h.id);
            return;
        case PowerState::SLEEPING:
        case PowerState::SWITCHING_OFF:
            LOG_F(WARNING, "Date=%g. Host %d woke up while %s, no wake-up was pending",
                  date, h.id, ::to_string(h.state).c_str());
            break;
    }

    h.state = PowerState::IDLE;
    h.transition_deadline = -1;
    h.idle_since = date;
    h.woken_at = date;
    h.ran_job_since_wake = false;
}

void ClusterState::on_sleep_pstate(Host & h, double date)
{
    switch (h.state)
    {
        case PowerState::SWITCHING_OFF:
            break;
        case PowerState::SLEEPING:
            LOG_F(1, "Host %d already in the sleep pstate", h.id);
            return;
        case PowerState::COMPUTING:
            throw ProtocolError(string_format("Host %d went to sleep while computing job '%s'",
                                              h.id, h.job_id.c_str()));
        case PowerState::IDLE:
        case PowerState::SWITCHING_ON:
            LOG_F(WARNING, "Date=%g. Host %d went to sleep while %s, no switch-off was pending",
                  date, h.id, ::to_string(h.state).c_str());
            break;
    }

    h.state = PowerState::SLEEPING;
    h.transition_deadline = -1;
}

void ClusterState::request_power_on(const IntervalSet & hosts, double date)
{
    check_hosts_exist(hosts);

    // All hosts are checked before any is modified
    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        const Host & h = _hostsById.at(*host_it);
        if (h.state != PowerState::SLEEPING)
            throw InvalidTransition(string_format("Cannot switch host %d on: it is %s",
                                                  h.id, ::to_string(h.state).c_str()));
    }

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        Host & h = host(*host_it);
        h.state = PowerState::SWITCHING_ON;
        h.transition_deadline = date + _switch_on_delay;
    }
}

void ClusterState::request_power_off(const IntervalSet & hosts, double date)
{
    check_hosts_exist(hosts);

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        const Host & h = _hostsById.at(*host_it);
        if (h.state != PowerState::IDLE)
            throw InvalidTransition(string_format("Cannot switch host %d off: it is %s",
                                                  h.id, ::to_string(h.state).c_str()));
    }

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        Host & h = host(*host_it);
        h.state = PowerState::SWITCHING_OFF;
        h.transition_deadline = date + _switch_off_delay;
    }
}

void ClusterState::assign_job(const string & job_id, const IntervalSet & hosts, double date)
{
    (void) date;
    check_hosts_exist(hosts);

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        const Host & h = _hostsById.at(*host_it);
        if (h.state != PowerState::IDLE || !h.job_id.empty())
            throw InvalidTransition(string_format("Cannot allocate host %d to job '%s': it is %s (job '%s')",
                                                  h.id, job_id.c_str(), ::to_string(h.state).c_str(),
                                                  h.job_id.c_str()));
    }

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        Host & h = host(*host_it);
        h.state = PowerState::COMPUTING;
        h.job_id = job_id;
        h.ran_job_since_wake = true;
    }
}

void ClusterState::release_job(const string & job_id, const IntervalSet & hosts, double date)
{
    check_hosts_exist(hosts);

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        const Host & h = _hostsById.at(*host_it);
        if (h.state != PowerState::COMPUTING || h.job_id != job_id)
            throw InvalidTransition(string_format("Cannot release host %d from job '%s': it is %s (job '%s')",
                                                  h.id, job_id.c_str(), ::to_string(h.state).c_str(),
                                                  h.job_id.c_str()));
    }

    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        Host & h = host(*host_it);
        h.state = PowerState::IDLE;
        h.job_id.clear();
        h.idle_since = date;
    }
}

IntervalSet ClusterState::available_hosts() const
{
    return hosts_in_state(PowerState::IDLE);
}

IntervalSet ClusterState::hosts_in_state(PowerState state) const
{
    IntervalSet hosts;
    for (const auto & mit : _hostsById)
    {
        if (mit.second.state == state)
            hosts.insert(mit.first);
    }
    return hosts;
}

IntervalSet ClusterState::all_hosts() const
{
    IntervalSet hosts;
    for (const auto & mit : _hostsById)
        hosts.insert(mit.first);
    return hosts;
}

int ClusterState::nb_hosts_in_state(PowerState state) const
{
    int nb = 0;
    for (const auto & mit : _hostsById)
    {
        if (mit.second.state == state)
            ++nb;
    }
    return nb;
}

const Host & ClusterState::operator[](int host_id) const
{
    auto it = _hostsById.find(host_id);
    if (it == _hostsById.end())
        throw ProtocolError(string_format("Host with id '%d' does not exist", host_id));
    return it->second;
}

Host & ClusterState::host(int host_id)
{
    auto it = _hostsById.find(host_id);
    if (it == _hostsById.end())
        throw ProtocolError(string_format("Host with id '%d' does not exist", host_id));
    return it->second;
}

bool ClusterState::contains(int host_id) const
{
    return _hostsById.count(host_id) == 1;
}

void ClusterState::check_hosts_exist(const IntervalSet & hosts) const
{
    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
    {
        if (!contains(*host_it))
            throw ProtocolError(string_format("Host with id '%d' does not exist", *host_it));
    }
}

int ClusterState::nb_hosts() const
{
    return (int) _hostsById.size();
}

int ClusterState::total_capacity() const
{
    return _total_capacity;
}

int ClusterState::capacity_of(const IntervalSet & hosts) const
{
    int capacity = 0;
    for (auto host_it = hosts.elements_begin(); host_it != hosts.elements_end(); ++host_it)
        capacity += (*this)[*host_it].capacity;
    return capacity;
}

int ClusterState::pstate_compute() const
{
    return _pstate_compute;
}

int ClusterState::pstate_sleep() const
{
    return _pstate_sleep;
}

double ClusterState::switch_on_delay() const
{
    return _switch_on_delay;
}

double ClusterState::switch_off_delay() const
{
    return _switch_off_delay;
}

std::string ClusterState::to_json_string() const
{
    std::string hosts = "[";

    for (auto it = _hostsById.begin(); it != _hostsById.end();)
    {
        hosts += it->second.to_json_string();
        ++it;
        if (it != _hostsById.end())
            hosts += ",";
    }
    hosts += "]";
    return hosts;
}
