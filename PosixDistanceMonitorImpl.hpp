#if !defined POSIX_DISTANCE_MONITOR_IMPL_HPP
#define POSIX_DISTANCE_MONITOR_IMPL_HPP

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "DistanceMonitorImpl.hpp"

#include "DeviceTracker.hpp"
#include "DistanceEstimator.hpp"
#include "MonitorService.hpp"
#include "OuiIdentityResolver.hpp"
#include "PosixAddressResolutionSource.hpp"
#include "PosixRadioSignalSource.hpp"
#include "ScanScheduler.hpp"
#include "SharedLog.hpp"

class PosixDistanceMonitorImpl : public DistanceMonitorImpl
{
public:

    PosixDistanceMonitorImpl(
        int                             argc,
        char**                          argv,
        const std::chrono::nanoseconds& period,
        const std::chrono::nanoseconds& tolerance =
        std::chrono::nanoseconds(static_cast<unsigned int>(1e8)));

    virtual ~PosixDistanceMonitorImpl();

    virtual void step();

protected:

    // Delivered signals handled here
    virtual void processDeliveredSignals();

private:

    // Interprets program arguments and applies corresponding state
    bool processArguments();

    // Parses the defaults file; false if it can't be read or holds a malformed number
    bool processDefaultFile(const std::string& filename);

    // Reads KEY=VALUE lines from the defaults file; false if it can't be read
    static bool readDefaultFile(const std::string&                  filename,
                                std::map<std::string, std::string>& defaults);

    // Picks the settings that may change while running out of the defaults, keyed the way
    // MonitorService expects them
    static void extractSettings(const std::map<std::string, std::string>& defaults,
                                std::map<std::string, std::string>&       settings);

    // Parses the file naming known devices; false if it can't be read
    bool processDevicesFile(const std::string& filename);

    // Applies SCAN_INTERVAL and DISTANCE_THRESHOLD from the defaults file
    bool applyConfiguredSettings(std::string& error_message);

    // Re-reads the defaults file and applies only the settings that may change while running;
    // used on SIGHUP
    void reloadSettings();

    // How long an in-flight scan may still take to finish
    std::chrono::milliseconds longestScan() const;

    // Replaces the report file with the current device list
    void writeReportFile();

    // Stops scanning, frees resources and triggers program shutdown at the end of the current
    // frame
    void shutdown();

    static void writePidToFile(const std::string& pid_filename);

    // Filename of the default settings file, typically located in /etc
    std::string default_filename;

    // Filename of the file naming known devices, typically located in /etc
    std::string devices_filename;

    // Filename of the log file, typically located in /var/log
    std::string log_filename;

    // Filename of the file in which PID is stored
    std::string pid_filename;

    // Filename of the file the device list is periodically written to
    std::string report_filename;

    // Name of the wireless interface both sources use
    std::string interface_name;

    PosixRadioSignalSource::Mode radio_scan_mode;

    unsigned int radio_scan_timeout;

    double arp_timeout;

    double hostname_timeout;

    double reference_power;

    double path_loss_exponent;

    // Seconds between report file updates
    double report_period;

    // Settings as read from the defaults file, keyed the way MonitorService expects them
    std::map<std::string, std::string> configured_settings;

    // Hardware address -> name, from the devices file
    std::map<std::string, std::string> display_names;

    // Whether or not this process should daemonize
    bool daemonize;

    // Set once shutdown has run
    bool is_shut_down;

    // Set once a scheduler failure has been logged, so it's only logged once
    bool scheduler_failure_logged;

    std::chrono::steady_clock::time_point last_report;

    // Used to log important distmon activities
    SharedLog log;

    std::unique_ptr<PosixRadioSignalSource> radio_source;

    std::unique_ptr<PosixAddressResolutionSource> address_source;

    OuiIdentityResolver identity_resolver;

    std::unique_ptr<DistanceEstimator> distance_estimator;

    std::unique_ptr<DeviceTracker> device_tracker;

    std::unique_ptr<MonitorService> monitor_service;

    // Declared last so it stops before anything it uses is destroyed
    std::unique_ptr<ScanScheduler> scan_scheduler;
};

#endif
