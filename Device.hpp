#if !defined DEVICE_HPP
#define DEVICE_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

// Details all known information about one device observed on the LAN.  Descriptive fields are
// empty until something fills them in.
struct Device
{
    Device(const std::string&                           hardware_address,
           double                                       signal,
           const std::chrono::system_clock::time_point& seen);

    // Appends a signal reading to the history, discarding the oldest reading if the history is
    // full, and makes it the current signal
    void recordSignal(double signal);

    // Mean of all readings in signal_history
    double averageSignal() const;

    // Fills the field in only if it is currently empty
    static void fillIfEmpty(std::string& field, const std::string& value);

    // Number of readings kept in signal_history
    static const std::size_t SIGNAL_HISTORY_LENGTH = 10;

    // Canonical uppercase colon-separated MAC address; never changes once set
    const std::string hardware_address;

    // Last known IPv4 address, empty until resolved
    std::string network_address;

    // Most recent raw signal reading in dBm
    double current_signal;

    // The last SIGNAL_HISTORY_LENGTH signal readings, oldest first
    std::deque<double> signal_history;

    // Last time this device was seen by either source
    std::chrono::system_clock::time_point last_seen;

    std::string display_name;
    std::string manufacturer;
    std::string device_type;
    std::string resolved_hostname;

    // Distance in meters derived from the average of signal_history
    double estimated_distance;
};

#endif
