#include "monitoring.hpp"

#include <stdexcept>

#include <loguru.hpp>

#include "job_queue_manager.hpp"
#include "machine.hpp"

using namespace std;

const string StateRecorder::CSV_HEADER = "time,nb_computing,nb_idle,nb_sleeping,nb_switching_on,nb_switching_off,"
                                         "running_jobs,waiting_jobs,utilization_rate,power";

StateRecorder::StateRecorder()
{

}

StateRecorder::~StateRecorder()
{
    if (_file != nullptr)
    {
        fclose(_file);
        _file = nullptr;
    }
}

void StateRecorder::open(const string &filename)
{
    if (_file != nullptr)
        fclose(_file);

    _file = fopen(filename.c_str(), "w");
    if (_file == nullptr)
        throw runtime_error("Cannot open state record file '" + filename + "'");

    _filename = filename;
    fprintf(_file, "%s\n", CSV_HEADER.c_str());
    fflush(_file);

    LOG_F(INFO, "Recording the cluster state into '%s'", filename.c_str());
}

bool StateRecorder::is_open() const
{
    return _file != nullptr;
}

StateSnapshot StateRecorder::snapshot(const ClusterState &cluster, const JobQueueManager &jobs, double date) const
{
    StateSnapshot snap;
    snap.time = date;
    snap.nb_computing = cluster.nb_hosts_in_state(PowerState::COMPUTING);
    snap.nb_idle = cluster.nb_hosts_in_state(PowerState::IDLE);
    snap.nb_sleeping = cluster.nb_hosts_in_state(PowerState::SLEEPING);
    snap.nb_switching_on = cluster.nb_hosts_in_state(PowerState::SWITCHING_ON);
    snap.nb_switching_off = cluster.nb_hosts_in_state(PowerState::SWITCHING_OFF);
    snap.running_jobs = jobs.nb_running();
    snap.waiting_jobs = jobs.nb_pending();

    if (cluster.total_capacity() > 0)
        snap.utilization_rate = (double) cluster.capacity_of(cluster.hosts_in_state(PowerState::COMPUTING)) /
                                cluster.total_capacity();

    snap.power = _current_power;
    return snap;
}

StateSnapshot StateRecorder::record(const ClusterState &cluster, const JobQueueManager &jobs, double date)
{
    StateSnapshot snap = snapshot(cluster, jobs, date);

    if (_file != nullptr)
    {
        fprintf(_file, "%f,%d,%d,%d,%d,%d,%d,%d,%f,%f\n", snap.time,
                snap.nb_computing, snap.nb_idle, snap.nb_sleeping, snap.nb_switching_on, snap.nb_switching_off,
                snap.running_jobs, snap.waiting_jobs, snap.utilization_rate, snap.power);
        fflush(_file);
    }

    ++_nb_records;
    LOG_F(1, "Date=%g. computing=%d idle=%d sleeping=%d switching_on=%d switching_off=%d running=%d waiting=%d",
          date, snap.nb_computing, snap.nb_idle, snap.nb_sleeping, snap.nb_switching_on, snap.nb_switching_off,
          snap.running_jobs, snap.waiting_jobs);

    return snap;
}

void StateRecorder::on_energy_answer(double consumed_energy, double date)
{
    // The first answer only sets the reference point
    if (_last_energy_time >= 0)
    {
        double time_diff = date - _last_energy_time;
        double energy_diff = consumed_energy - _last_energy;

        if (time_diff > 0)
            _current_power = energy_diff / time_diff;
    }

    _last_energy = consumed_energy;
    _last_energy_time = date;
}

double StateRecorder::current_power() const
{
    return _current_power;
}

int StateRecorder::nb_records() const
{
    return _nb_records;
}
