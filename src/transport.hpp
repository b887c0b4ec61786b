#pragma once

#include <string>

#include "protocol.hpp"

class AbstractNetwork;
class SchedulingDecision;

/**
 * @brief Exchanges event batches and decisions with the backend, enforcing the protocol order
 * @details Every received batch must be answered exactly once before the next one is read.
 *          The first batch must start with SIMULATION_BEGINS, timestamps never go backwards
 *          and nothing can be read once SIMULATION_ENDS has been answered.
 *          Any violation raises a ProtocolError.
 */
class Transport
{
public:
    explicit Transport(AbstractNetwork * network);

    /**
     * @brief Blocks until the backend sends a batch, then decodes and checks it
     * @return The batch, whose events are in timestamp order
     */
    EventBatch receive_batch();

    /**
     * @brief Sends the decisions of the pending batch, then clears them
     * @param[in] now The date of the reply, which cannot be earlier than the batch date
     * @param[in,out] decision The decisions of the pass
     */
    void send_decisions(double now, SchedulingDecision & decision);

    double now() const;
    bool awaiting_reply() const;
    bool simulation_ended() const;
    int nb_batches() const;

private:
    void check_batch(const EventBatch & batch);

private:
    AbstractNetwork * _network;
    JsonProtocolReader _reader;
    double _now = 0;
    bool _awaiting_reply = false;
    bool _simulation_began = false;
    bool _simulation_ended = false;
    int _nb_batches = 0;
};
