#ifndef POWERSCHED_TOOLS_HPP
#define POWERSCHED_TOOLS_HPP

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

#include "exact_numbers.hpp"

namespace powersched_tools
{
    enum class JobState
    {
         PENDING    //!< The job has been submitted and waits for resources.
        ,RUNNING    //!< The job has been allocated and is being processed by the backend.
        ,COMPLETED  //!< The backend reported the end of the job (successful or not).
        ,REJECTED   //!< The job has been rejected by the scheduler.
    };

    enum class REJECT_TYPES
    {
        INFEASIBLE_REQUEST  //!< The job requests more than the whole cluster capacity.
    };

    // Completion statuses as reported by the backend in JOB_COMPLETED events
    namespace job_status
    {
        const std::string SUCCESS = "SUCCESS";
        const std::string FAILED = "FAILED";
        const std::string TIMEOUT = "TIMEOUT";
        const std::string KILLED = "KILLED";
    };

    template<typename ... Args>
    std::string string_format( std::string format, Args ... args )
    {
        int size_s = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
        if( size_s <= 0 ){ throw std::runtime_error( "Error during formatting." ); }
        auto size = static_cast<size_t>( size_s );
        std::unique_ptr<char[]> buf( new char[ size ] );
        std::snprintf( buf.get(), size, format.c_str(), args ... );
        return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
    }

    std::string to_string(JobState state);
    std::string to_string(REJECT_TYPES reason);
    std::string to_string(const Rational & value);
}

#endif
