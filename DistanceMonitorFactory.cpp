#include <chrono>

#include "DistanceMonitorFactory.hpp"

#if defined LINUX
#include "PosixDistanceMonitorImpl.hpp"
#endif

//=============================================================================================
DistanceMonitorImpl* DistanceMonitorFactory::createDistanceMonitor(
    int                             argc,
    char**                          argv,
    const std::chrono::nanoseconds& period)
{
#if defined LINUX
    return new PosixDistanceMonitorImpl(argc, argv, period);
#else
    // The wireless and ARP sources only exist for Linux so far
    return 0;
#endif
}
