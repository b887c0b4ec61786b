#pragma once

#include "protocol.hpp"

class ISchedulingAlgorithm;
class SchedulingDecision;
class Transport;
class Workload;

/**
 * @brief Forwards the events of a batch to the algorithm, in order
 * @details Submitted jobs are added to the workload before the algorithm is told about them.
 */
void dispatch_batch(const EventBatch & batch, ISchedulingAlgorithm * algo, Workload & workload);

/**
 * @brief Runs the request/reply loop until the backend ends the simulation
 * @details Every received batch is dispatched, then one scheduling pass is made and its
 *          decisions are sent back. Errors propagate to the caller, nothing is sent after them.
 */
void run(Transport & transport, ISchedulingAlgorithm * algo, SchedulingDecision & decision, Workload & workload);
