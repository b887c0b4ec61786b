#include "powersched_tools.hpp"

std::string powersched_tools::to_string(powersched_tools::JobState state)
{
    switch (state)
    {
        case JobState::PENDING:
            return "pending";
        case JobState::RUNNING:
            return "running";
        case JobState::COMPLETED:
            return "completed";
        case JobState::REJECTED:
            return "rejected";
    }
    return "unknown";
}

std::string powersched_tools::to_string(powersched_tools::REJECT_TYPES reason)
{
    switch (reason)
    {
        case REJECT_TYPES::INFEASIBLE_REQUEST:
            return "InfeasibleRequest";
    }
    return "unknown";
}

std::string powersched_tools::to_string(const Rational & value)
{
    return powersched_tools::string_format("%g", value.convert_to<double>());
}

