#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <string>

#include "MonitorService.hpp"

#include "Device.hpp"
#include "DeviceTracker.hpp"

const char* const MonitorService::SCAN_INTERVAL_KEY      = "scan_interval";
const char* const MonitorService::DISTANCE_THRESHOLD_KEY = "distance_threshold";

//=============================================================================================
MonitorService::MonitorService(DeviceTracker& device_tracker) :
    device_tracker(device_tracker)
{
}

//=============================================================================================
MonitorService::~MonitorService()
{
}

//=============================================================================================
TrackerSettings MonitorService::getSettings() const
{
    return device_tracker.getSettings();
}

//=============================================================================================
bool MonitorService::setSettings(const std::map<std::string, std::string>& new_settings,
                                 TrackerSettings&                          updated_settings,
                                 std::string&                              error_message)
{
    // Omitted settings stay not-a-number, which the tracker leaves as they are when it applies
    // the rest under its own lock
    TrackerSettings requested;
    requested.scan_interval      = std::numeric_limits<double>::quiet_NaN();
    requested.distance_threshold = std::numeric_limits<double>::quiet_NaN();

    // Validate everything before applying anything
    for (std::map<std::string, std::string>::const_iterator i = new_settings.begin();
         i != new_settings.end();
         ++i)
    {
        double* target = 0;
        if (i->first == SCAN_INTERVAL_KEY)
        {
            target = &requested.scan_interval;
        }
        else if (i->first == DISTANCE_THRESHOLD_KEY)
        {
            target = &requested.distance_threshold;
        }
        else
        {
            error_message = "Unknown setting \"" + i->first + "\"";
            return false;
        }

        if (!parseNumber(i->second, *target))
        {
            error_message = "Setting " + i->first + " must be a number, not \"" +
                i->second + "\"";
            return false;
        }
    }

    if (new_settings.empty())
    {
        updated_settings = device_tracker.getSettings();
        return true;
    }

    updated_settings =
        device_tracker.updateSettings(requested.scan_interval, requested.distance_threshold);

    return true;
}

//=============================================================================================
std::map<std::string, DeviceSummary> MonitorService::listDevices() const
{
    const std::map<std::string, Device> devices =
        device_tracker.snapshot(device_tracker.getSettings().distance_threshold);

    std::map<std::string, DeviceSummary> summaries;
    for (std::map<std::string, Device>::const_iterator i = devices.begin();
         i != devices.end();
         ++i)
    {
        const Device& device = i->second;

        DeviceSummary& summary = summaries[i->first];
        summary.distance          = device.estimated_distance;
        summary.signal            = device.current_signal;
        summary.last_seen         = formatTimestamp(device.last_seen);
        summary.network_address   = device.network_address;
        summary.hardware_address  = device.hardware_address;
        summary.manufacturer      = device.manufacturer;
        summary.device_type       = device.device_type;
        summary.resolved_hostname = device.resolved_hostname;
    }

    return summaries;
}

//=============================================================================================
void MonitorService::writeReport(std::ostream& report_stream) const
{
    const std::map<std::string, DeviceSummary> summaries = listDevices();

    report_stream << "# device\tdistance\tsignal\tlast_seen\tnetwork_address\t"
                  << "hardware_address\tmanufacturer\tdevice_type\tresolved_hostname\n";

    for (std::map<std::string, DeviceSummary>::const_iterator i = summaries.begin();
         i != summaries.end();
         ++i)
    {
        const DeviceSummary& summary = i->second;

        report_stream << i->first << "\t"
                      << std::fixed << std::setprecision(2) << summary.distance << "\t"
                      << std::setprecision(1) << summary.signal << "\t"
                      << summary.last_seen << "\t"
                      << summary.network_address << "\t"
                      << summary.hardware_address << "\t"
                      << summary.manufacturer << "\t"
                      << summary.device_type << "\t"
                      << summary.resolved_hostname << "\n";
    }
}

//=============================================================================================
std::string MonitorService::formatTimestamp(
    const std::chrono::system_clock::time_point& timestamp)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);

    // to_time_t may round, so derive the fraction from what it actually returned
    long long microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
        timestamp - std::chrono::system_clock::from_time_t(seconds)).count();

    std::time_t whole_seconds = seconds;
    if (microseconds < 0)
    {
        whole_seconds -= 1;
        microseconds  += 1000000;
    }

    std::tm local_time;
    localtime_r(&whole_seconds, &local_time);

    char date_time[32];
    std::strftime(date_time, sizeof(date_time), "%Y-%m-%dT%H:%M:%S", &local_time);

    std::ostringstream timestamp_stream;
    timestamp_stream << date_time << "." << std::setw(6) << std::setfill('0') << microseconds;

    return timestamp_stream.str();
}

//=============================================================================================
bool MonitorService::parseNumber(const std::string& text, double& number)
{
    std::istringstream convert_to_number(text);

    double converted = 0.0;
    convert_to_number >> converted;

    if (convert_to_number.fail() || !std::isfinite(converted))
    {
        return false;
    }

    // Trailing whitespace is fine, anything else isn't
    convert_to_number >> std::ws;
    if (!convert_to_number.eof())
    {
        return false;
    }

    number = converted;
    return true;
}
