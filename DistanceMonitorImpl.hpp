#if !defined DISTANCE_MONITOR_IMPL_HPP
#define DISTANCE_MONITOR_IMPL_HPP

#include <chrono>

#include "FixedRateProgram.hpp"

class DistanceMonitorImpl : public FixedRateProgram
{
public:

    friend class DistanceMonitor;

    DistanceMonitorImpl(int                             argc,
                        char**                          argv,
                        const std::chrono::nanoseconds& period,
                        const std::chrono::nanoseconds& tolerance);

    virtual ~DistanceMonitorImpl();

    // Body of the main loop, executed periodically and indefinitely
    virtual void step() = 0;
};

#endif
