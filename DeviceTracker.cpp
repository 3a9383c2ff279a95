#include <chrono>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "DeviceTracker.hpp"

#include "AddressResolutionSource.hpp"
#include "Device.hpp"
#include "DistanceEstimator.hpp"
#include "HardwareAddress.hpp"
#include "IdentityResolver.hpp"
#include "RadioSignalSource.hpp"
#include "SharedLog.hpp"

const std::chrono::seconds DeviceTracker::STALE_DEVICE_TIMEOUT(300);

const double DeviceTracker::UNMEASURED_SIGNAL = -100.0;

const double DeviceTracker::MINIMUM_SCAN_INTERVAL      = 1.0;
const double DeviceTracker::MAXIMUM_SCAN_INTERVAL      = 60.0;
const double DeviceTracker::MINIMUM_DISTANCE_THRESHOLD = 1.0;
const double DeviceTracker::MAXIMUM_DISTANCE_THRESHOLD = 100.0;

const double DeviceTracker::DEFAULT_SCAN_INTERVAL      = 2.0;
const double DeviceTracker::DEFAULT_DISTANCE_THRESHOLD = 30.0;

//=============================================================================================
DeviceTracker::DeviceTracker(RadioSignalSource&       radio_source,
                             AddressResolutionSource& address_source,
                             const IdentityResolver&  identity_resolver,
                             const DistanceEstimator& distance_estimator,
                             SharedLog&               log) :
    radio_source(radio_source),
    address_source(address_source),
    identity_resolver(identity_resolver),
    distance_estimator(distance_estimator),
    log(log)
{
    settings.scan_interval      = DEFAULT_SCAN_INTERVAL;
    settings.distance_threshold = DEFAULT_DISTANCE_THRESHOLD;
}

//=============================================================================================
DeviceTracker::~DeviceTracker()
{
}

//=============================================================================================
void DeviceTracker::scan()
{
    scan(std::chrono::system_clock::now());
}

//=============================================================================================
// Signal discovery runs before address resolution so a device seen only by address resolution
// never replaces a record built from radio readings.  Neither query holds the table lock.
//=============================================================================================
void DeviceTracker::scan(const std::chrono::system_clock::time_point& now)
{
    std::string error_message;

    std::map<std::string, double> signals;
    if (!radio_source.query(signals, error_message))
    {
        log.write("Radio scan failed: " + error_message);
        signals.clear();
    }

    {
        std::lock_guard<std::mutex> lock(devices_mutex);
        mergeSignals(signals, now);
    }

    std::vector<AddressBinding> bindings;
    if (!address_source.query(bindings, error_message))
    {
        log.write("Address resolution failed: " + error_message);
        bindings.clear();
    }

    std::lock_guard<std::mutex> lock(devices_mutex);

    mergeBindings(bindings, now);
    estimateDistances();
    evictStaleDevices(now);

    std::ostringstream message_stream;
    message_stream << "Scan complete, " << signals.size() << " radio readings, "
                   << bindings.size() << " address replies, " << devices.size()
                   << " devices tracked";
    log.write(message_stream.str());
}

//=============================================================================================
std::map<std::string, Device> DeviceTracker::snapshot(double distance_threshold) const
{
    std::map<std::string, Device> copies;

    std::lock_guard<std::mutex> lock(devices_mutex);

    for (DeviceTable::const_iterator i = devices.begin(); i != devices.end(); ++i)
    {
        if (i->second.estimated_distance <= distance_threshold)
        {
            copies.insert(std::make_pair(label(i->second), i->second));
        }
    }

    return copies;
}

//=============================================================================================
// Non-finite values leave the corresponding setting as it is
//=============================================================================================
TrackerSettings DeviceTracker::updateSettings(double scan_interval, double distance_threshold)
{
    TrackerSettings applied;

    {
        std::lock_guard<std::mutex> lock(settings_mutex);

        if (std::isfinite(scan_interval))
        {
            settings.scan_interval =
                clamp(scan_interval, MINIMUM_SCAN_INTERVAL, MAXIMUM_SCAN_INTERVAL);
        }

        if (std::isfinite(distance_threshold))
        {
            settings.distance_threshold = clamp(distance_threshold,
                                                MINIMUM_DISTANCE_THRESHOLD,
                                                MAXIMUM_DISTANCE_THRESHOLD);
        }

        applied = settings;
    }

    std::ostringstream message_stream;
    message_stream << "Settings updated, scan interval " << applied.scan_interval
                   << "s, distance threshold " << applied.distance_threshold << "m";
    log.write(message_stream.str());

    return applied;
}

//=============================================================================================
TrackerSettings DeviceTracker::getSettings() const
{
    std::lock_guard<std::mutex> lock(settings_mutex);
    return settings;
}

//=============================================================================================
void DeviceTracker::setDisplayNames(const std::map<std::string, std::string>& display_names)
{
    std::lock_guard<std::mutex> lock(devices_mutex);

    this->display_names.clear();

    for (std::map<std::string, std::string>::const_iterator i = display_names.begin();
         i != display_names.end();
         ++i)
    {
        std::string canonical;
        if (hardwareAddress::normalize(i->first, canonical))
        {
            this->display_names[canonical] = i->second;
        }
    }

    // Name anything already being tracked
    for (DeviceTable::iterator i = devices.begin(); i != devices.end(); ++i)
    {
        std::map<std::string, std::string>::const_iterator name =
            this->display_names.find(i->first);
        if (name != this->display_names.end())
        {
            Device::fillIfEmpty(i->second.display_name, name->second);
        }
    }
}

//=============================================================================================
std::string DeviceTracker::label(const Device& device)
{
    if (!device.display_name.empty())
    {
        return device.display_name;
    }

    return "Device (" + device.hardware_address + ")";
}

//=============================================================================================
// Merges radio signal readings into the table; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
void DeviceTracker::mergeSignals(const std::map<std::string, double>&        signals,
                                 const std::chrono::system_clock::time_point& now)
{
    for (std::map<std::string, double>::const_iterator i = signals.begin();
         i != signals.end();
         ++i)
    {
        DeviceTable::iterator existing = devices.find(i->first);

        if (existing == devices.end())
        {
            Device& device = addDevice(i->first, i->second, now);

            // Hostname isn't known yet, the address alone will have to do
            Identity identity = identity_resolver.resolve(device.hardware_address, "");
            device.manufacturer = identity.manufacturer;
            device.device_type  = identity.device_type;

            // Readers may see this device before the scan completes
            estimateDistance(device);

            std::ostringstream message_stream;
            message_stream << "Device " << device.hardware_address << " appeared with signal "
                           << i->second << " dBm";
            log.write(message_stream.str());

            continue;
        }

        Device& device = existing->second;
        device.recordSignal(i->second);
        device.last_seen = now;
        estimateDistance(device);

        if (device.manufacturer.empty())
        {
            Identity identity =
                identity_resolver.resolve(device.hardware_address, device.resolved_hostname);
            device.manufacturer = identity.manufacturer;
            refineDeviceType(device, identity.device_type);
        }
    }
}

//=============================================================================================
// Merges address resolution results into the table; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
void DeviceTracker::mergeBindings(const std::vector<AddressBinding>&           bindings,
                                  const std::chrono::system_clock::time_point& now)
{
    for (std::vector<AddressBinding>::const_iterator i = bindings.begin();
         i != bindings.end();
         ++i)
    {
        DeviceTable::iterator existing = devices.find(i->hardware_address);

        // Seen by address resolution only, so there's no real signal reading to go on
        if (existing == devices.end())
        {
            Device& device = addDevice(i->hardware_address, UNMEASURED_SIGNAL, now);
            device.network_address   = i->network_address;
            device.resolved_hostname = i->hostname;

            Identity identity = identity_resolver.resolve(device.hardware_address, i->hostname);
            device.manufacturer = identity.manufacturer;
            device.device_type  = identity.device_type;

            estimateDistance(device);

            std::ostringstream message_stream;
            message_stream << "Device " << device.hardware_address << " ("
                           << device.network_address << ") appeared without a signal reading";
            log.write(message_stream.str());

            continue;
        }

        Device& device = existing->second;
        device.network_address = i->network_address;
        device.last_seen       = now;

        // A fresh lookup is authoritative
        if (!i->hostname.empty())
        {
            device.resolved_hostname = i->hostname;
        }

        // The hostname may say more about what this device is than the address did
        Identity identity =
            identity_resolver.resolve(device.hardware_address, device.resolved_hostname);
        Device::fillIfEmpty(device.manufacturer, identity.manufacturer);
        refineDeviceType(device, identity.device_type);
    }
}

//=============================================================================================
// Recomputes every device's distance; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
void DeviceTracker::estimateDistances()
{
    for (DeviceTable::iterator i = devices.begin(); i != devices.end(); ++i)
    {
        estimateDistance(i->second);
    }
}

//=============================================================================================
// Recomputes one device's distance from its signal history; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
void DeviceTracker::estimateDistance(Device& device)
{
    std::string error_message;
    if (!distance_estimator.estimate(device.averageSignal(),
                                     device.estimated_distance,
                                     error_message))
    {
        log.write("Distance estimate for " + device.hardware_address + " failed: " +
                  error_message);
    }
}

//=============================================================================================
// Drops devices not seen recently; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
void DeviceTracker::evictStaleDevices(const std::chrono::system_clock::time_point& now)
{
    DeviceTable::iterator i = devices.begin();
    while (i != devices.end())
    {
        if (now - i->second.last_seen >= STALE_DEVICE_TIMEOUT)
        {
            log.write("Device " + i->first + " is no longer present");
            devices.erase(i++);
        }
        else
        {
            ++i;
        }
    }
}

//=============================================================================================
// Creates a device and applies anything known about it in advance; ASSUMES THE TABLE IS LOCKED
//=============================================================================================
Device& DeviceTracker::addDevice(const std::string&                           hardware_address,
                                 double                                       signal,
                                 const std::chrono::system_clock::time_point& now)
{
    DeviceTable::iterator added =
        devices.insert(std::make_pair(hardware_address,
                                      Device(hardware_address, signal, now))).first;

    std::map<std::string, std::string>::const_iterator name =
        display_names.find(hardware_address);
    if (name != display_names.end())
    {
        added->second.display_name = name->second;
    }

    return added->second;
}

//=============================================================================================
void DeviceTracker::refineDeviceType(Device& device, const std::string& device_type)
{
    if (device_type.empty() ||
        (device_type == IdentityResolver::UNKNOWN_DEVICE_TYPE && !device.device_type.empty()))
    {
        return;
    }

    device.device_type = device_type;
}

//=============================================================================================
double DeviceTracker::clamp(double value, double minimum, double maximum)
{
    if (value < minimum)
    {
        return minimum;
    }
    else if (value > maximum)
    {
        return maximum;
    }

    return value;
}
