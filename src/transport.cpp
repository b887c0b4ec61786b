#include "transport.hpp"

#include <boost/algorithm/string.hpp>

#include <loguru.hpp>

#include "decision.hpp"
#include "errors.hpp"
#include "network.hpp"
#include "powersched_tools.hpp"

using namespace std;
using powersched_tools::string_format;

Transport::Transport(AbstractNetwork * network) :
    _network(network)
{

}

EventBatch Transport::receive_batch()
{
    if (_simulation_ended)
        throw ProtocolError("Cannot receive anything after SIMULATION_ENDS");
    if (_awaiting_reply)
        throw ProtocolError("Cannot receive a batch before the previous one has been answered");

    string received_message;
    _network->read(received_message);

    if (boost::trim_copy(received_message).empty())
        throw ProtocolError("Empty message received (connection lost ?)");

    EventBatch batch = _reader.parse(received_message);
    check_batch(batch);

    _now = batch.now;
    _awaiting_reply = true;
    ++_nb_batches;

    return batch;
}

void Transport::check_batch(const EventBatch & batch)
{
    if (batch.now < _now)
        throw ProtocolError(string_format("Time went backwards: received a batch at %g after one at %g",
                                          batch.now, _now));

    if (!_simulation_began &&
        (batch.events.empty() || batch.events.front().type != EventType::SIMULATION_BEGINS))
        throw ProtocolError("The first message must begin with SIMULATION_BEGINS");

    double previous_timestamp = -1;
    bool simulation_began = _simulation_began;
    bool simulation_ended = false;

    for (unsigned int event_i = 0; event_i < batch.events.size(); ++event_i)
    {
        const Event & event = batch.events[event_i];

        if (event.timestamp > batch.now)
            throw ProtocolError(string_format("Event #%d (%s) is dated %g, after the message date %g",
                                              event_i, to_string(event.type).c_str(), event.timestamp, batch.now));
        if (event.timestamp < previous_timestamp)
            throw ProtocolError(string_format("Event #%d (%s) is dated %g, before the previous event (%g)",
                                              event_i, to_string(event.type).c_str(), event.timestamp, previous_timestamp));
        if (simulation_ended)
            throw ProtocolError(string_format("Event #%d (%s) follows SIMULATION_ENDS",
                                              event_i, to_string(event.type).c_str()));

        if (event.type == EventType::SIMULATION_BEGINS)
        {
            if (simulation_began)
                throw ProtocolError("SIMULATION_BEGINS received twice");
            simulation_began = true;
        }
        else if (event.type == EventType::SIMULATION_ENDS)
            simulation_ended = true;

        previous_timestamp = event.timestamp;
    }

    _simulation_began = simulation_began;
    _simulation_ended = simulation_ended;
}

void Transport::send_decisions(double now, SchedulingDecision & decision)
{
    if (!_awaiting_reply)
        throw ProtocolError("Cannot send decisions: no batch is waiting for a reply");
    if (now < _now)
        throw ProtocolError(string_format("Cannot reply at %g to a batch received at %g", now, _now));

    if (_simulation_ended && !decision.is_empty())
    {
        LOG_F(WARNING, "Dropping %d decisions taken after SIMULATION_ENDS", (int) decision.decisions().size());
        decision.clear();
    }

    double message_date = max(now, decision.last_date());
    const string message_to_send = decision.content(message_date);
    _network->write(message_to_send);

    decision.clear();
    _awaiting_reply = false;
}

double Transport::now() const
{
    return _now;
}

bool Transport::awaiting_reply() const
{
    return _awaiting_reply;
}

bool Transport::simulation_ended() const
{
    return _simulation_ended;
}

int Transport::nb_batches() const
{
    return _nb_batches;
}
