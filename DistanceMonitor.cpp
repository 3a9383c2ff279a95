#include <chrono>
#include <stdexcept>

#include "DistanceMonitor.hpp"

#include "DistanceMonitorFactory.hpp"
#include "DistanceMonitorImpl.hpp"
#include "misc.hpp"

//=============================================================================================
DistanceMonitor::DistanceMonitor(int                             argc,
                                 char**                          argv,
                                 const std::chrono::nanoseconds& period) :
    distance_monitor_impl(0)
{
    distance_monitor_impl = DistanceMonitorFactory::createDistanceMonitor(argc, argv, period);

    if (!distance_monitor_impl)
    {
        throw std::runtime_error("No DistanceMonitorImpl available for this platform");
    }
}

//=============================================================================================
DistanceMonitor::~DistanceMonitor()
{
    delete distance_monitor_impl;
}

//=============================================================================================
int DistanceMonitor::run()
{
    IF_NULL_THROW_ELSE_RUN(distance_monitor_impl,
                           "No DistanceMonitorImpl available for this platform",
                           return distance_monitor_impl->run());
}

//=============================================================================================
void DistanceMonitor::setTerminate(bool terminate)
{
    IF_NULL_THROW_ELSE_RUN(distance_monitor_impl,
                           "No DistanceMonitorImpl available for this platform",
                           distance_monitor_impl->setTerminate(terminate));
}

//=============================================================================================
bool DistanceMonitor::getTerminate() const
{
    IF_NULL_THROW_ELSE_RUN(distance_monitor_impl,
                           "No DistanceMonitorImpl available for this platform",
                           return distance_monitor_impl->getTerminate());
}
