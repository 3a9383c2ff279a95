#include <chrono>
#include <numeric>
#include <string>

#include "Device.hpp"

const std::size_t Device::SIGNAL_HISTORY_LENGTH;

//=============================================================================================
Device::Device(const std::string&                           hardware_address,
               double                                       signal,
               const std::chrono::system_clock::time_point& seen) :
    hardware_address(hardware_address),
    current_signal(signal),
    last_seen(seen),
    estimated_distance(0.0)
{
    signal_history.push_back(signal);
}

//=============================================================================================
// Appends a signal reading to the history, discarding the oldest reading if the history is
// full, and makes it the current signal
//=============================================================================================
void Device::recordSignal(double signal)
{
    current_signal = signal;

    signal_history.push_back(signal);
    while (signal_history.size() > SIGNAL_HISTORY_LENGTH)
    {
        signal_history.pop_front();
    }
}

//=============================================================================================
double Device::averageSignal() const
{
    // History is seeded on construction, but don't divide by zero if that ever changes
    if (signal_history.empty())
    {
        return current_signal;
    }

    return std::accumulate(signal_history.begin(), signal_history.end(), 0.0) /
        signal_history.size();
}

//=============================================================================================
void Device::fillIfEmpty(std::string& field, const std::string& value)
{
    if (field.empty())
    {
        field = value;
    }
}
