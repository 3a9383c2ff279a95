#if !defined DEVICE_TRACKER_HPP
#define DEVICE_TRACKER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "AddressResolutionSource.hpp"
#include "Device.hpp"

class DistanceEstimator;
class IdentityResolver;
class RadioSignalSource;
class SharedLog;

// Settings that may be changed while scanning is in progress
struct TrackerSettings
{
    // Seconds between the end of one scan and the start of the next
    double scan_interval;

    // Devices estimated to be further away than this many meters aren't reported
    double distance_threshold;
};

// Owns the table of devices currently present on the LAN.  Scans are meant to be run from one
// thread; any number of other threads may take snapshots while a scan is in progress.
class DeviceTracker
{
public:

    DeviceTracker(RadioSignalSource&       radio_source,
                  AddressResolutionSource& address_source,
                  const IdentityResolver&  identity_resolver,
                  const DistanceEstimator& distance_estimator,
                  SharedLog&               log);

    ~DeviceTracker();

    // Runs one complete scan cycle: queries both sources, merges what they report into the
    // table, re-estimates distances and evicts devices that haven't been seen recently.
    // Source failures are logged and treated as empty results.
    void scan();

    // Same as above with the cycle taking place at the given time
    void scan(const std::chrono::system_clock::time_point& now);

    // Copies of all devices no further away than distance_threshold, keyed by display name if
    // the device has one and "Device (<hardware address>)" otherwise
    std::map<std::string, Device> snapshot(double distance_threshold) const;

    // Clamps and applies new settings, returning the settings now in effect.  A non-finite
    // value leaves that setting unchanged, so either setting may be updated on its own.
    TrackerSettings updateSettings(double scan_interval, double distance_threshold);

    TrackerSettings getSettings() const;

    // Hardware address -> display name for devices the user has named; applied to devices as
    // they're discovered
    void setDisplayNames(const std::map<std::string, std::string>& display_names);

    // Label a device is reported under
    static std::string label(const Device& device);

    // Devices not seen for this long are evicted
    static const std::chrono::seconds STALE_DEVICE_TIMEOUT;

    // Signal assumed for devices found only by address resolution
    static const double UNMEASURED_SIGNAL;

    static const double MINIMUM_SCAN_INTERVAL;
    static const double MAXIMUM_SCAN_INTERVAL;
    static const double MINIMUM_DISTANCE_THRESHOLD;
    static const double MAXIMUM_DISTANCE_THRESHOLD;

    static const double DEFAULT_SCAN_INTERVAL;
    static const double DEFAULT_DISTANCE_THRESHOLD;

private:

    typedef std::map<std::string, Device> DeviceTable;

    // Merges radio signal readings into the table; ASSUMES THE TABLE IS LOCKED
    void mergeSignals(const std::map<std::string, double>&        signals,
                      const std::chrono::system_clock::time_point& now);

    // Merges address resolution results into the table; ASSUMES THE TABLE IS LOCKED
    void mergeBindings(const std::vector<AddressBinding>&           bindings,
                       const std::chrono::system_clock::time_point& now);

    // Recomputes every device's distance; ASSUMES THE TABLE IS LOCKED
    void estimateDistances();

    // Recomputes one device's distance from its signal history; ASSUMES THE TABLE IS LOCKED
    void estimateDistance(Device& device);

    // Drops devices not seen recently; ASSUMES THE TABLE IS LOCKED
    void evictStaleDevices(const std::chrono::system_clock::time_point& now);

    // Creates a device and applies anything known about it in advance; ASSUMES THE TABLE IS
    // LOCKED
    Device& addDevice(const std::string&                           hardware_address,
                      double                                       signal,
                      const std::chrono::system_clock::time_point& now);

    // Replaces a device's type unless the new guess knows less than the current one
    static void refineDeviceType(Device& device, const std::string& device_type);

    static double clamp(double value, double minimum, double maximum);

    RadioSignalSource& radio_source;

    AddressResolutionSource& address_source;

    const IdentityResolver& identity_resolver;

    const DistanceEstimator& distance_estimator;

    SharedLog& log;

    // Keyed by hardware address
    DeviceTable devices;

    std::map<std::string, std::string> display_names;

    // Guards devices and display_names
    mutable std::mutex devices_mutex;

    TrackerSettings settings;

    mutable std::mutex settings_mutex;

    DeviceTracker(const DeviceTracker&);
    DeviceTracker& operator=(const DeviceTracker&);
};

#endif
