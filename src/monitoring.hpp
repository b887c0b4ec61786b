#pragma once

#include <cstdio>
#include <string>

class ClusterState;
class JobQueueManager;

struct StateSnapshot
{
    double time = 0;
    int nb_computing = 0;
    int nb_idle = 0;
    int nb_sleeping = 0;
    int nb_switching_on = 0;
    int nb_switching_off = 0;
    int running_jobs = 0;
    int waiting_jobs = 0;
    double utilization_rate = 0; // computing capacity / total capacity
    double power = 0;            // mean power (W) between the two latest energy answers
};

/**
 * @brief Writes a CSV trace of the cluster state and derives the power from consumed energy answers
 */
class StateRecorder
{
public:
    StateRecorder();
    StateRecorder(const StateRecorder &) = delete;
    StateRecorder & operator=(const StateRecorder &) = delete;
    ~StateRecorder();

    /**
     * @brief Opens (and overwrites) the CSV file, then writes its header
     * @details Throws a std::runtime_error if the file cannot be opened
     */
    void open(const std::string & filename);
    bool is_open() const;

    StateSnapshot snapshot(const ClusterState & cluster, const JobQueueManager & jobs, double date) const;
    StateSnapshot record(const ClusterState & cluster, const JobQueueManager & jobs, double date);

    void on_energy_answer(double consumed_energy, double date);
    double current_power() const;
    int nb_records() const;

    static const std::string CSV_HEADER;

private:
    FILE * _file = nullptr;
    std::string _filename;
    double _last_energy = 0;
    double _last_energy_time = -1;
    double _current_power = 0;
    int _nb_records = 0;
};
