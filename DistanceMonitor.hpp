#if !defined DISTANCE_MONITOR_HPP
#define DISTANCE_MONITOR_HPP

#include <chrono>

class DistanceMonitorImpl;

// Tracks devices on the LAN and estimates how far away they are, using whatever
// implementation suits this platform
class DistanceMonitor
{
public:

    DistanceMonitor(int                             argc,
                    char**                          argv,
                    const std::chrono::nanoseconds& period);

    ~DistanceMonitor();

    // Runs the main loop until terminated
    int run();

    void setTerminate(bool terminate);
    bool getTerminate() const;

private:

    DistanceMonitorImpl* distance_monitor_impl;

    DistanceMonitor(const DistanceMonitor&);
    DistanceMonitor& operator=(const DistanceMonitor&);
};

#endif
