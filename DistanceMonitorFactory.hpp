#if !defined DISTANCE_MONITOR_FACTORY_HPP
#define DISTANCE_MONITOR_FACTORY_HPP

#include <chrono>

class DistanceMonitorImpl;

// Provides a platform-independent way of acquiring platform-specific distance monitors.
class DistanceMonitorFactory
{
public:

    // Returns null if there is no implementation for this platform
    static DistanceMonitorImpl* createDistanceMonitor(int                             argc,
                                                      char**                          argv,
                                                      const std::chrono::nanoseconds& period);

private:

    // Disallowed, only static functions here
    DistanceMonitorFactory();
    ~DistanceMonitorFactory();

    DistanceMonitorFactory(const DistanceMonitorFactory&);
    DistanceMonitorFactory& operator=(const DistanceMonitorFactory&);
};

#endif
