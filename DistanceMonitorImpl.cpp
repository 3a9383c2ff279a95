#include <chrono>

#include "DistanceMonitorImpl.hpp"

#include "FixedRateProgram.hpp"

//=============================================================================================
DistanceMonitorImpl::DistanceMonitorImpl(int                             argc,
                                         char**                          argv,
                                         const std::chrono::nanoseconds& period,
                                         const std::chrono::nanoseconds& tolerance) :
    FixedRateProgram(argc, argv, period, tolerance)
{
}

//=============================================================================================
DistanceMonitorImpl::~DistanceMonitorImpl()
{
}
