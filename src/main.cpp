#include <stdio.h>

#include <fstream>
#include <set>
#include <string>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <loguru.hpp>

#include <args.hxx>

#include "config.hpp"
#include "decision.hpp"
#include "errors.hpp"
#include "job_queue_manager.hpp"
#include "json_workload.hpp"
#include "locality.hpp"
#include "machine.hpp"
#include "network.hpp"
#include "queue.hpp"
#include "simulation_loop.hpp"
#include "transport.hpp"

#include "algo/energy_backfilling.hpp"

using namespace std;
using namespace boost;

/** @def STR_HELPER(x)
 *  @brief Helper macro to retrieve the string view of a macro.
 */
#define STR_HELPER(x) #x

/** @def STR(x)
 *  @brief Macro to get a const char* from a macro
 */
#define STR(x) STR_HELPER(x)

/** @def POWERSCHED_VERSION
 *  @brief What powersched --version should return.
 *
 *  It is either set by CMake or set to vUNKNOWN_PLEASE_COMPILE_VIA_CMAKE
**/
#ifndef POWERSCHED_VERSION
    #define POWERSCHED_VERSION vUNKNOWN_PLEASE_COMPILE_VIA_CMAKE
#endif

namespace
{
    string choices_string(const set<string> & choices)
    {
        return "{" + boost::algorithm::join(choices, ", ") + "}";
    }

    // Throws args::ValidationError if the flag value is not one of the choices
    void check_choice(args::ValueFlag<string> & flag, const set<string> & choices)
    {
        if (choices.count(flag.Get()) == 0)
            throw args::ValidationError(str(format("Invalid '%1%' value (%2%): Not in %3%")
                                            % flag.Name()
                                            % flag.Get()
                                            % choices_string(choices)));
    }
}

int main(int argc, char ** argv)
{
    const set<string> variants = {"conservative_bf", "easy_bf"};
    const set<string> policies = {"basic", "contiguous"};
    const set<string> queue_orders = {"fcfs", "lcfs", "asc_size", "desc_size",
                                      "asc_walltime", "desc_walltime"};
    const set<string> verbosity_levels = {"debug", "info", "quiet", "silent"};

    args::ArgumentParser parser("powersched: a power-aware backfilling scheduler for Batsim.");
    args::HelpFlag flag_help(parser, "help", "Print this help and exit", {'h', "help"});

    args::ValueFlag<string> flag_selection_policy(parser, "policy", "How hosts are picked among the free ones. One of " + choices_string(policies), {'p', "policy"}, "basic");
    args::ValueFlag<string> flag_socket_endpoint(parser, "endpoint", "ZeroMQ endpoint the backend connects to", {'s', "socket-endpoint"}, "tcp://*:28000");
    args::ValueFlag<string> flag_scheduling_variant(parser, "variant", "Backfilling flavour. One of " + choices_string(variants), {'v', "variant"}, "conservative_bf");
    args::ValueFlag<string> flag_variant_options(parser, "options", "Power and backfilling options, as a JSON object", {"variant_options"}, "{}");
    args::ValueFlag<string> flag_variant_options_filepath(parser, "options-filepath", "File holding the JSON options. Takes precedence over --variant_options", {"variant_options_filepath"}, "");
    args::ValueFlag<string> flag_queue_order(parser, "order", "Order of the pending jobs. One of " + choices_string(queue_orders), {'o', "queue_order"}, "fcfs");
    args::ValueFlag<string> flag_verbosity_level(parser, "verbosity-level", "Amount of logging on stderr. One of " + choices_string(verbosity_levels), {"verbosity"}, "info");
    args::Flag flag_version(parser, "version", "Print the version and exit", {"version"});

    try
    {
        parser.ParseCLI(argc, argv);

        check_choice(flag_selection_policy, policies);
        check_choice(flag_queue_order, queue_orders);
        check_choice(flag_scheduling_variant, variants);
        check_choice(flag_verbosity_level, verbosity_levels);
    }
    catch(args::Help&)
    {
        parser.helpParams.addDefault = true;
        printf("%s", parser.Help().c_str());
        return 0;
    }
    catch(args::ParseError & e)
    {
        printf("%s\n", e.what());
        return 1;
    }
    catch(args::ValidationError & e)
    {
        printf("%s\n", e.what());
        return 1;
    }

    if (flag_version)
    {
        printf("%s\n", STR(POWERSCHED_VERSION));
        return 0;
    }

    const string verbosity_level = flag_verbosity_level.Get();
    const string queue_order = flag_queue_order.Get();
    const string variant_options_filepath = flag_variant_options_filepath.Get();
    string variant_options = flag_variant_options.Get();

    if (verbosity_level == "debug")
        loguru::g_stderr_verbosity = loguru::Verbosity_1;
    else if (verbosity_level == "quiet")
        loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
    else if (verbosity_level == "silent")
        loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    else
        loguru::g_stderr_verbosity = loguru::Verbosity_INFO;

    if (!variant_options_filepath.empty())
    {
        ifstream options_file(variant_options_filepath);
        if (!options_file.is_open())
        {
            printf("Cannot read the options file '%s'\n", variant_options_filepath.c_str());
            return 1;
        }
        variant_options.assign(std::istreambuf_iterator<char>(options_file),
                               std::istreambuf_iterator<char>());
    }

    SchedulerConfig config;
    try
    {
        config = SchedulerConfig::from_json_string(variant_options);
    }
    catch (const ConfigError & e)
    {
        printf("%s. variant_options='%s'\n", e.what(), variant_options.c_str());
        return 1;
    }
    LOG_F(1, "variant_options = '%s'", variant_options.c_str());

    if (flag_scheduling_variant.Get() == "easy_bf")
        config.reservation_depth = 1;

    SortableJobOrder * order = nullptr;
    Queue * queue = nullptr;
    ResourceSelector * selector = nullptr;
    ISchedulingAlgorithm * algo = nullptr;
    int exit_status = 0;

    try
    {
        Workload w;
        SchedulingDecision decision;

        if (queue_order == "fcfs")
            order = new FCFSOrder;
        else if (queue_order == "lcfs")
            order = new LCFSOrder;
        else if (queue_order == "asc_size")
            order = new AscendingSizeOrder;
        else if (queue_order == "desc_size")
            order = new DescendingSizeOrder;
        else if (queue_order == "asc_walltime")
            order = new AscendingWalltimeOrder;
        else
            order = new DescendingWalltimeOrder;

        queue = new Queue(order);
        JobQueueManager jobs(&w, queue);
        ClusterState cluster(config.pstate_compute, config.pstate_sleep,
                             config.switch_on_delay, config.switch_off_delay);

        if (flag_selection_policy.Get() == "basic")
            selector = new BasicResourceSelector;
        else
            selector = new ContiguousResourceSelector;

        algo = new EnergyBackfilling(&w, &decision, selector, &cluster, &jobs, config);

        Network n;
        n.bind(flag_socket_endpoint.Get());
        Transport transport(&n);

        run(transport, algo, decision, w);
    }
    catch (const ProtocolError & e)
    {
        LOG_F(ERROR, "Protocol error: %s", e.what());
        exit_status = 2;
    }
    catch (const InvalidTransition & e)
    {
        LOG_F(ERROR, "Invalid host transition: %s", e.what());
        exit_status = 3;
    }
    catch (const InvalidJobTransition & e)
    {
        LOG_F(ERROR, "Invalid job transition: %s", e.what());
        exit_status = 3;
    }
    catch (const std::exception & e)
    {
        LOG_F(ERROR, "%s", e.what());
        exit_status = 1;
    }

    delete algo;
    delete selector;
    delete queue;
    delete order;

    return exit_status;
}
