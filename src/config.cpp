#include "config.hpp"

#include <loguru.hpp>

#include "errors.hpp"
#include "powersched_tools.hpp"

using namespace std;
namespace r = rapidjson;

namespace
{
    void read_option(const r::Value & options, const char * name, int & variable)
    {
        if (!options.HasMember(name))
            return;
        if (!options[name].IsInt())
            throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member '%s' must be integral", name));
        variable = options[name].GetInt();
    }

    void read_option(const r::Value & options, const char * name, double & variable)
    {
        if (!options.HasMember(name))
            return;
        if (!options[name].IsNumber())
            throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member '%s' must be a number", name));
        variable = options[name].GetDouble();
    }

    void read_option(const r::Value & options, const char * name, bool & variable)
    {
        if (!options.HasMember(name))
            return;
        if (!options[name].IsBool())
            throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member '%s' must be a boolean", name));
        variable = options[name].GetBool();
    }

    void read_option(const r::Value & options, const char * name, string & variable)
    {
        if (!options.HasMember(name))
            return;
        if (!options[name].IsString())
            throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member '%s' must be a string", name));
        variable = options[name].GetString();
    }

    void check_non_negative(const char * name, double value)
    {
        if (value < 0)
            throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member '%s' value must be non-negative (got %g)", name, value));
    }
}

SchedulerConfig SchedulerConfig::from_json(const r::Value & options)
{
    if (!options.IsObject())
        throw ConfigError("Invalid variant options: Not a JSON object");

    SchedulerConfig config;

    read_option(options, "pstate_compute", config.pstate_compute);
    read_option(options, "pstate_sleep", config.pstate_sleep);
    read_option(options, "idle_time_to_sleep", config.idle_time_to_sleep);
    read_option(options, "wake_cooldown", config.wake_cooldown);
    read_option(options, "switch_on_delay", config.switch_on_delay);
    read_option(options, "switch_off_delay", config.switch_off_delay);
    read_option(options, "allow_wake", config.allow_wake);
    read_option(options, "power_management", config.power_management);
    read_option(options, "backfill_window", config.backfill_window);
    read_option(options, "reservation_depth", config.reservation_depth);
    read_option(options, "energy_monitoring", config.energy_monitoring);
    read_option(options, "record_interval", config.record_interval);
    read_option(options, "record_file", config.record_file);

    if (config.pstate_compute < 0)
        throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member 'pstate_compute' value must be non-negative (got %d)", config.pstate_compute));
    if (config.pstate_sleep < 0)
        throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member 'pstate_sleep' value must be non-negative (got %d)", config.pstate_sleep));
    if (config.pstate_compute == config.pstate_sleep)
        throw ConfigError("Invalid options JSON object: 'pstate_compute' and 'pstate_sleep' must differ");

    check_non_negative("idle_time_to_sleep", config.idle_time_to_sleep);
    check_non_negative("wake_cooldown", config.wake_cooldown);
    check_non_negative("switch_on_delay", config.switch_on_delay);
    check_non_negative("switch_off_delay", config.switch_off_delay);

    if (config.backfill_window < -1 || config.backfill_window == 0)
        throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member 'backfill_window' must be -1 or strictly positive (got %d)", config.backfill_window));
    if (config.reservation_depth < -1)
        throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member 'reservation_depth' must be -1 or positive (got %d)", config.reservation_depth));
    if (config.record_interval <= 0)
        throw ConfigError(powersched_tools::string_format("Invalid options JSON object: Member 'record_interval' must be strictly positive (got %g)", config.record_interval));

    LOG_F(1, "idle_time_to_sleep=%g, wake_cooldown=%g, switch_on_delay=%g, switch_off_delay=%g",
          config.idle_time_to_sleep, config.wake_cooldown, config.switch_on_delay, config.switch_off_delay);

    return config;
}

SchedulerConfig SchedulerConfig::from_json_string(const string & options)
{
    r::Document doc;
    doc.Parse(options.c_str());
    if (doc.HasParseError() || !doc.IsObject())
        throw ConfigError("Invalid variant options: Not a JSON object. variant_options='" + options + "'");

    return from_json(doc);
}
