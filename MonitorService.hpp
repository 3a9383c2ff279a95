#if !defined MONITOR_SERVICE_HPP
#define MONITOR_SERVICE_HPP

#include <chrono>
#include <map>
#include <ostream>
#include <string>

#include "DeviceTracker.hpp"

// What is reported about a single device
struct DeviceSummary
{
    // Meters
    double distance;

    // Most recent reading, dBm
    double signal;

    // ISO-8601 local time
    std::string last_seen;

    std::string network_address;
    std::string hardware_address;
    std::string manufacturer;
    std::string device_type;
    std::string resolved_hostname;
};

// The operations offered to whatever presents devices and settings to the user
class MonitorService
{
public:

    explicit MonitorService(DeviceTracker& device_tracker);

    ~MonitorService();

    TrackerSettings getSettings() const;

    // Applies any of "scan_interval" and "distance_threshold" present in new_settings.  If a
    // value isn't a number or a key isn't recognized nothing is applied and false is returned
    // with error_message saying why.  Otherwise updated_settings holds the settings now in
    // effect, after clamping.
    bool setSettings(const std::map<std::string, std::string>& new_settings,
                     TrackerSettings&                          updated_settings,
                     std::string&                              error_message);

    // Devices within the current distance threshold, keyed by label
    std::map<std::string, DeviceSummary> listDevices() const;

    // Writes listDevices() as a header line followed by one tab-separated line per device
    void writeReport(std::ostream& report_stream) const;

    // Formats as YYYY-MM-DDTHH:MM:SS.ffffff in local time
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& timestamp);

    // Converts text to a finite number; the whole text must be used
    static bool parseNumber(const std::string& text, double& number);

    static const char* const SCAN_INTERVAL_KEY;
    static const char* const DISTANCE_THRESHOLD_KEY;

private:

    DeviceTracker& device_tracker;

    MonitorService(const MonitorService&);
    MonitorService& operator=(const MonitorService&);
};

#endif
