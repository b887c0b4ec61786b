#pragma once

#include <string>
#include <vector>

#include <rapidjson/document.h>

#include <intervalset.hpp>

/**
 * @brief Builds the messages exchanged with the simulation backend
 * @details The scheduler only sends decisions. The backend-side appends exist so that
 *          a backend (or a test playing its role) can be written with the same tool.
 *
 *          A message reads
 *          {"now": 12.5, "events": [{"timestamp": 12.5, "type": "EXECUTE_JOB",
 *                                   "data": {"job_id": "w0!3", "alloc": "0-1 4"}}]}
 *          Host sets are written as space-separated ids and closed ranges.
 */
class AbstractProtocolWriter
{
public:
    virtual ~AbstractProtocolWriter() {}

    // Messages from the scheduler to the backend
    virtual void append_execute_job(const std::string & job_id,
                                    const IntervalSet & allocated_resources,
                                    double date) = 0;
    virtual void append_reject_job(const std::string & job_id,
                                   double date) = 0;
    virtual void append_set_resource_state(const IntervalSet & resources,
                                           const std::string & new_state,
                                           double date) = 0;
    virtual void append_call_me_later(double future_date,
                                      double date) = 0;
    virtual void append_query_consumed_energy(double date) = 0;

    // Messages from the backend to the scheduler
    virtual void append_simulation_begins(int nb_resources, double date) = 0;
    virtual void append_simulation_begins(const std::string & compute_resources_json, double date) = 0;
    virtual void append_simulation_ends(double date) = 0;
    virtual void append_job_submitted(const std::string & job_id,
                                      const std::string & job_description,
                                      double date) = 0;
    virtual void append_job_completed(const std::string & job_id,
                                      const std::string & job_status,
                                      double date) = 0;
    virtual void append_job_killed(const std::vector<std::string> & job_ids,
                                   double date) = 0;
    virtual void append_resource_state_changed(const IntervalSet & resources,
                                               const std::string & new_state,
                                               double date) = 0;
    virtual void append_requested_call(double date) = 0;
    virtual void append_answer_energy(double consumed_energy, double date) = 0;
    virtual void append_notify(const std::string & notify_type, double date) = 0;

    // Management functions
    virtual void clear() = 0;
    virtual std::string generate_current_message(double date) = 0;
    virtual bool is_empty() const = 0;
    virtual double last_date() const = 0;
};

class JsonProtocolWriter : public AbstractProtocolWriter
{
public:
    JsonProtocolWriter();
    JsonProtocolWriter(const JsonProtocolWriter &) = delete;
    JsonProtocolWriter & operator=(const JsonProtocolWriter &) = delete;
    ~JsonProtocolWriter();

    void append_execute_job(const std::string & job_id,
                            const IntervalSet & allocated_resources,
                            double date);
    void append_reject_job(const std::string & job_id,
                           double date);
    void append_set_resource_state(const IntervalSet & resources,
                                   const std::string & new_state,
                                   double date);
    void append_call_me_later(double future_date,
                              double date);
    void append_query_consumed_energy(double date);

    void append_simulation_begins(int nb_resources, double date);
    void append_simulation_begins(const std::string & compute_resources_json, double date);
    void append_simulation_ends(double date);
    void append_job_submitted(const std::string & job_id,
                              const std::string & job_description,
                              double date);
    void append_job_completed(const std::string & job_id,
                              const std::string & job_status,
                              double date);
    void append_job_killed(const std::vector<std::string> & job_ids,
                           double date);
    void append_resource_state_changed(const IntervalSet & resources,
                                       const std::string & new_state,
                                       double date);
    void append_requested_call(double date);
    void append_answer_energy(double consumed_energy, double date);
    void append_notify(const std::string & notify_type, double date);

    void clear();
    std::string generate_current_message(double date);
    bool is_empty() const { return _is_empty; }
    double last_date() const { return _last_date; }

private:
    void check_date(double date);
    void push_event(const char * type, rapidjson::Value & data, double date);

private:
    bool _is_empty = true;
    double _last_date = -1;
    rapidjson::Document _doc;
    rapidjson::Document::AllocatorType & _alloc;
    rapidjson::Value _events = rapidjson::Value(rapidjson::kArrayType);
};

enum class EventType
{
     SIMULATION_BEGINS
    ,SIMULATION_ENDS
    ,JOB_SUBMITTED
    ,JOB_COMPLETED
    ,JOB_KILLED
    ,RESOURCE_STATE_CHANGED
    ,REQUESTED_CALL
    ,ANSWER
    ,NOTIFY
};

std::string to_string(EventType type);

/**
 * @brief One decoded backend event. Only the members relevant to its type are set.
 */
struct Event
{
    EventType type;
    double timestamp = 0;

    std::string job_id;                  // JOB_SUBMITTED, JOB_COMPLETED
    std::string job_description;         // JOB_SUBMITTED: the 'job' object, as a JSON string
    std::string job_status;              // JOB_COMPLETED
    std::vector<std::string> job_ids;    // JOB_KILLED
    IntervalSet resources;               // RESOURCE_STATE_CHANGED
    int pstate = -1;                     // RESOURCE_STATE_CHANGED
    double consumed_energy = -1;         // ANSWER, -1 if not answered
    std::string notify_type;             // NOTIFY
    std::string data;                    // SIMULATION_BEGINS: the whole data object, as a JSON string
};

struct EventBatch
{
    double now = 0;
    std::vector<Event> events;
};

/**
 * @brief Decodes the messages sent by the backend
 * @details Every structural problem (invalid JSON, missing or mistyped member, unknown
 *          event type) raises a ProtocolError. Ordering is checked by the Transport.
 */
class JsonProtocolReader
{
public:
    EventBatch parse(const std::string & message) const;

private:
    Event parse_event(const rapidjson::Value & event_object, int event_index) const;
};
