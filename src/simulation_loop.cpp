#include "simulation_loop.hpp"

#include <rapidjson/document.h>

#include <loguru.hpp>

#include "decision.hpp"
#include "errors.hpp"
#include "isalgorithm.hpp"
#include "json_workload.hpp"
#include "transport.hpp"

using namespace std;
namespace r = rapidjson;

void dispatch_batch(const EventBatch & batch, ISchedulingAlgorithm * algo, Workload & workload)
{
    for (const Event & event : batch.events)
    {
        const double current_date = event.timestamp;

        switch (event.type)
        {
            case EventType::SIMULATION_BEGINS:
            {
                r::Document doc;
                doc.Parse(event.data.c_str());
                if (doc.HasParseError())
                    throw ProtocolError("Invalid SIMULATION_BEGINS data ###" + event.data + "###");

                algo->on_simulation_start(current_date, doc);
                break;
            }
            case EventType::SIMULATION_ENDS:
                algo->on_simulation_end(current_date);
                break;
            case EventType::JOB_SUBMITTED:
                workload.add_job_from_json_description_string(event.job_description, event.job_id, current_date);
                algo->on_job_release(current_date, {event.job_id});
                break;
            case EventType::JOB_COMPLETED:
                algo->on_job_end(current_date, {event.job_id}, event.job_status);
                break;
            case EventType::JOB_KILLED:
                algo->on_job_killed(current_date, event.job_ids);
                break;
            case EventType::RESOURCE_STATE_CHANGED:
                algo->on_machine_state_changed(current_date, event.resources, event.pstate);
                break;
            case EventType::REQUESTED_CALL:
                algo->on_requested_call(current_date);
                break;
            case EventType::ANSWER:
                if (event.consumed_energy >= 0)
                    algo->on_answer_energy_consumption(current_date, event.consumed_energy);
                break;
            case EventType::NOTIFY:
                if (event.notify_type == "no_more_static_job_to_submit")
                    algo->on_no_more_static_job_to_submit_received(current_date);
                else if (event.notify_type == "no_more_external_event_to_occur")
                    algo->on_no_more_external_event_to_occur(current_date);
                else
                    LOG_F(WARNING, "Date=%g. Ignoring NOTIFY of unknown type '%s'", current_date, event.notify_type.c_str());
                break;
        }
    }
}

void run(Transport & transport, ISchedulingAlgorithm * algo, SchedulingDecision & decision, Workload & workload)
{
    while (!transport.simulation_ended())
    {
        EventBatch batch = transport.receive_batch();

        dispatch_batch(batch, algo, workload);

        algo->make_decisions(batch.now);
        algo->clear_recent_data_structures();

        transport.send_decisions(batch.now, decision);
    }
}
