// This program tracks the devices present on the attached wireless LAN and estimates how far
// each one is from this host using its signal strength.

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <map>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "PosixDistanceMonitorImpl.hpp"

#include "DeviceTracker.hpp"
#include "DistanceEstimator.hpp"
#include "HardwareAddress.hpp"
#include "MonitorService.hpp"
#include "PosixAddressResolutionSource.hpp"
#include "PosixRadioSignalSource.hpp"
#include "ScanScheduler.hpp"
#include "SignalManager.hpp"

//=============================================================================================
PosixDistanceMonitorImpl::PosixDistanceMonitorImpl(int                             argc,
                                                   char**                          argv,
                                                   const std::chrono::nanoseconds& period,
                                                   const std::chrono::nanoseconds& tolerance) :
    DistanceMonitorImpl(argc, argv, period, tolerance),
    default_filename("/etc/distmon/config"),
    devices_filename("/etc/distmon/devices"),
    log_filename("/var/log/distmon.log"),
    pid_filename("/var/run/distmon.pid"),
    report_filename("/var/run/distmon.devices"),
    interface_name("wlan0"),
    radio_scan_mode(PosixRadioSignalSource::STATION_DUMP),
    radio_scan_timeout(5),
    arp_timeout(2.0),
    hostname_timeout(2.0),
    reference_power(DistanceEstimator::DEFAULT_REFERENCE_POWER),
    path_loss_exponent(DistanceEstimator::DEFAULT_PATH_LOSS_EXPONENT),
    report_period(5.0),
    daemonize(false),
    is_shut_down(false),
    scheduler_failure_logged(false)
{
    // Arguments are processed twice; once to find the defaults file and again so they
    // override what's in it
    if (!processArguments())
    {
        throw std::runtime_error("Cannot process arguments");
    }

    // Read configuration settings
    if (!processDefaultFile(default_filename))
    {
        throw std::runtime_error("Cannot process default file");
    }

    processArguments();

    // Initialize the log file
    if (!log.openFile(log_filename))
    {
        throw std::runtime_error("Cannot open log file " + log_filename);
    }

    // Devices don't have to be named
    if (!processDevicesFile(devices_filename))
    {
        log.write("No devices file at " + devices_filename + ", devices will not be named");
    }

    if (daemonize && daemon(0, 0) != 0)
    {
        throw std::runtime_error("Cannot daemonize");
    }

    // Write our PID to file
    writePidToFile(pid_filename);

    // Register signals to handle
    SignalManager* signal_manager = getSignalManager();
    signal_manager->registerSignal(SIGINT);
    signal_manager->registerSignal(SIGTERM);
    signal_manager->registerSignal(SIGHUP);
    signal_manager->registerSignal(SIGUSR1);
    signal_manager->registerSignal(SIGUSR2);

    radio_source.reset(
        new PosixRadioSignalSource(interface_name, radio_scan_mode, radio_scan_timeout));

    address_source.reset(new PosixAddressResolutionSource(
        interface_name,
        std::chrono::milliseconds(static_cast<long>(arp_timeout * 1000.0)),
        std::chrono::milliseconds(static_cast<long>(hostname_timeout * 1000.0))));

    distance_estimator.reset(new DistanceEstimator(reference_power, path_loss_exponent));

    device_tracker.reset(new DeviceTracker(*radio_source,
                                           *address_source,
                                           identity_resolver,
                                           *distance_estimator,
                                           log));
    device_tracker->setDisplayNames(display_names);

    monitor_service.reset(new MonitorService(*device_tracker));

    std::string error_message;
    if (!applyConfiguredSettings(error_message))
    {
        throw std::runtime_error("Invalid settings in " + default_filename + ": " +
                                 error_message);
    }

    // Note that the service has started
    log.write("Service starting on " + interface_name);

    last_report = std::chrono::steady_clock::now();

    scan_scheduler.reset(new ScanScheduler(*device_tracker, log));
    scan_scheduler->start();
}

//=============================================================================================
PosixDistanceMonitorImpl::~PosixDistanceMonitorImpl()
{
    shutdown();
}

//=============================================================================================
// Body of the main loop, executed periodically and indefinitely
//=============================================================================================
void PosixDistanceMonitorImpl::step()
{
    std::chrono::steady_clock::time_point frame_start = std::chrono::steady_clock::now();

    // Is it time to write another report?
    if (frame_start - last_report >= std::chrono::duration<double>(report_period))
    {
        last_report = frame_start;
        writeReportFile();
    }

    // Scanning stopping on its own is worth noting, but the last devices found are still
    // reported
    if (!scheduler_failure_logged &&
        scan_scheduler &&
        scan_scheduler->getStatus() == ScanScheduler::FAILED)
    {
        log.write("Scanning has failed, device information will no longer be updated");
        scheduler_failure_logged = true;
    }

    // It's possible for this to run shutdown(), which itself releases resources needed by this
    // class.  Let's handle signals here, so if we do indeed shutdown we do so after this frame
    // has used all the needed resources.
    processDeliveredSignals();
}

//=============================================================================================
// Delivered signals handled here
//=============================================================================================
void PosixDistanceMonitorImpl::processDeliveredSignals()
{
    SignalManager* signal_manager = getSignalManager();

    if (signal_manager->isSignalDelivered(SIGUSR1))
    {
        // Logrotate uses this
        log.closeFile();
    }

    if (signal_manager->isSignalDelivered(SIGUSR2))
    {
        // Logrotate uses this
        log.openFile(log_filename);
    }

    if (signal_manager->isSignalDelivered(SIGHUP))
    {
        reloadSettings();
    }

    if (signal_manager->isSignalDelivered(SIGINT) ||
        signal_manager->isSignalDelivered(SIGTERM))
    {
        shutdown();
    }
}

//=============================================================================================
// Interprets program arguments and applies corresponding state
//=============================================================================================
bool PosixDistanceMonitorImpl::processArguments()
{
    std::vector<std::string> arguments;
    getArguments(arguments);

    std::vector<std::string>::const_iterator current_argument = arguments.begin();

    while(current_argument != arguments.end())
    {
        // Convenience reference to the next argument
        std::vector<std::string>::const_iterator next_argument = current_argument + 1;

        // Argument -D indicates this process should daemonize itself
        if (*current_argument == "-D")
        {
            daemonize = true;
        }
        else if (next_argument != arguments.end())
        {
            // Assume we're going to process a valid argument here.  If we don't this will be
            // set false
            bool twoarg_processed = true;

            // Argument -c specifies the devices file filename
            if (*current_argument == "-c")
            {
                devices_filename = *next_argument;
            }
            // Argument -d specifies the default file filename
            else if (*current_argument == "-d")
            {
                default_filename = *next_argument;
            }
            // Argument -i specifies the wireless interface
            else if (*current_argument == "-i")
            {
                interface_name = *next_argument;
            }
            // Argument -l specifies the log file filename
            else if (*current_argument == "-l")
            {
                log_filename = *next_argument;
            }
            // Argument --pidfile specifies the file in which the PID is stored
            else if (*current_argument == "--pidfile")
            {
                pid_filename = *next_argument;
            }
            // Argument --report specifies the file the device list is written to
            else if (*current_argument == "--report")
            {
                report_filename = *next_argument;
            }
            else
            {
                twoarg_processed = false;
            }

            // If we processed a switch with an argument then we should bump the current
            // argument here to prevent the argument from being processed again
            if (twoarg_processed)
            {
                ++current_argument;
            }
        }

        // Move on to the next argument
        ++current_argument;
    }

    // If execution reaches here there was an acceptable set of arguments provided
    return true;
}

//=============================================================================================
// Parses distmon defaults file
//=============================================================================================
bool PosixDistanceMonitorImpl::processDefaultFile(const std::string& filename)
{
    std::map<std::string, std::string> defaults;
    if (!readDefaultFile(filename, defaults))
    {
        return false;
    }

    for (std::map<std::string, std::string>::const_iterator i = defaults.begin();
         i != defaults.end();
         ++i)
    {
        const std::string& left_side  = i->first;
        const std::string& right_side = i->second;

        // Numeric settings are converted up front so typos are caught
        double number = 0.0;
        const bool is_number = MonitorService::parseNumber(right_side, number);

        // Now set the appropriate variable based on what was just parsed
        if (left_side == "WIFI_INTERFACE")
        {
            interface_name = right_side;
        }
        else if (left_side == "DEVICES_FILE")
        {
            devices_filename = right_side;
        }
        else if (left_side == "LOG_FILE")
        {
            log_filename = right_side;
        }
        else if (left_side == "PID_FILE")
        {
            pid_filename = right_side;
        }
        else if (left_side == "REPORT_FILE")
        {
            report_filename = right_side;
        }
        else if (left_side == "DAEMONIZE")
        {
            daemonize = right_side == "yes";
        }
        else if (left_side == "RADIO_SCAN_MODE")
        {
            if (!PosixRadioSignalSource::parseMode(right_side, radio_scan_mode))
            {
                return false;
            }
        }
        else if (left_side == "RADIO_SCAN_TIMEOUT")
        {
            if (!is_number || number < 1.0)
            {
                return false;
            }
            radio_scan_timeout = static_cast<unsigned int>(number + 0.5);
        }
        else if (left_side == "ARP_TIMEOUT")
        {
            if (!is_number || number <= 0.0)
            {
                return false;
            }
            arp_timeout = number;
        }
        else if (left_side == "HOSTNAME_TIMEOUT")
        {
            if (!is_number || number <= 0.0)
            {
                return false;
            }
            hostname_timeout = number;
        }
        else if (left_side == "REPORT_PERIOD")
        {
            if (!is_number || number <= 0.0)
            {
                return false;
            }
            report_period = number;
        }
        else if (left_side == "REFERENCE_POWER")
        {
            if (!is_number)
            {
                return false;
            }
            reference_power = number;
        }
        else if (left_side == "PATH_LOSS_EXPONENT")
        {
            if (!is_number || number <= 0.0)
            {
                return false;
            }
            path_loss_exponent = number;
        }
    }

    // Validated when applied
    extractSettings(defaults, configured_settings);

    return true;
}

//=============================================================================================
// Reads KEY=VALUE lines from the defaults file; later lines override earlier ones
//=============================================================================================
bool PosixDistanceMonitorImpl::readDefaultFile(const std::string&                  filename,
                                               std::map<std::string, std::string>& defaults)
{
    std::ifstream default_stream(filename.c_str());
    if (default_stream.fail())
    {
        return false;
    }

    std::string default_line_string;
    while (std::getline(default_stream, default_line_string))
    {
        // Ignore the line if it's blank or a comment
        if (default_line_string.empty() || default_line_string[0] == '#')
        {
            continue;
        }

        // Search through the line for a '='
        size_t equal_sign = default_line_string.find('=');

        // If there isn't an equal sign, or the equal sign is at the beginning or end of the
        // line, just go to the next line because this line is bad
        if (equal_sign == std::string::npos ||
            equal_sign == 0 ||
            equal_sign == default_line_string.length() - 1)
        {
            continue;
        }

        // Pull out the strings on the left and right of the equal sign
        defaults[default_line_string.substr(0, equal_sign)] =
            default_line_string.substr(equal_sign + 1, std::string::npos);
    }

    return true;
}

//=============================================================================================
void PosixDistanceMonitorImpl::extractSettings(
    const std::map<std::string, std::string>& defaults,
    std::map<std::string, std::string>&       settings)
{
    settings.clear();

    std::map<std::string, std::string>::const_iterator setting =
        defaults.find("SCAN_INTERVAL");
    if (setting != defaults.end())
    {
        settings[MonitorService::SCAN_INTERVAL_KEY] = setting->second;
    }

    setting = defaults.find("DISTANCE_THRESHOLD");
    if (setting != defaults.end())
    {
        settings[MonitorService::DISTANCE_THRESHOLD_KEY] = setting->second;
    }
}

//=============================================================================================
// Parses the devices file; each line is a hardware address followed by the name to give that
// device
//=============================================================================================
bool PosixDistanceMonitorImpl::processDevicesFile(const std::string& filename)
{
    std::ifstream devices_stream(filename.c_str());
    if (devices_stream.fail())
    {
        return false;
    }

    std::string devices_line;
    unsigned int line_number = 0;

    while (std::getline(devices_stream, devices_line))
    {
        line_number++;

        std::istringstream devices_line_stream(devices_line);

        // Read the hardware address
        std::string token;
        devices_line_stream >> token;

        // Skip blank lines and comments
        if (token.empty() || token[0] == '#')
        {
            continue;
        }

        // The rest of the line is the name
        std::string name;
        std::getline(devices_line_stream >> std::ws, name);

        std::string canonical;
        if (!hardwareAddress::normalize(token, canonical) || name.empty())
        {
            std::ostringstream message_stream;
            message_stream << "Ignoring malformed line " << line_number << " of " << filename;
            log.write(message_stream.str());
            continue;
        }

        display_names[canonical] = name;
    }

    return true;
}

//=============================================================================================
bool PosixDistanceMonitorImpl::applyConfiguredSettings(std::string& error_message)
{
    TrackerSettings applied;
    return monitor_service->setSettings(configured_settings, applied, error_message);
}

//=============================================================================================
// Re-reads the defaults file and applies its settings; used on SIGHUP
//=============================================================================================
void PosixDistanceMonitorImpl::reloadSettings()
{
    // Everything else in the file was fixed at start-up, along with any argument overriding
    // it, and stays that way
    std::map<std::string, std::string> defaults;
    if (!readDefaultFile(default_filename, defaults))
    {
        log.write("Cannot read " + default_filename + ", settings unchanged");
        return;
    }

    extractSettings(defaults, configured_settings);

    std::string error_message;
    if (!applyConfiguredSettings(error_message))
    {
        log.write("Settings rejected: " + error_message);
    }
}

//=============================================================================================
// A scan runs out the radio timeout, then the ARP reply window, then the hostname lookup
// window at most
//=============================================================================================
std::chrono::milliseconds PosixDistanceMonitorImpl::longestScan() const
{
    return std::chrono::milliseconds(static_cast<long>(
        (radio_scan_timeout + arp_timeout + hostname_timeout) * 1000.0));
}

//=============================================================================================
// Replaces the report file with the current device list
//=============================================================================================
void PosixDistanceMonitorImpl::writeReportFile()
{
    // Written aside and renamed into place so readers never see a partial report
    const std::string temporary_filename = report_filename + ".tmp";

    std::ofstream report_stream(temporary_filename.c_str(), std::ofstream::trunc);
    if (report_stream.fail())
    {
        log.write("Cannot write report file " + temporary_filename);
        return;
    }

    monitor_service->writeReport(report_stream);
    report_stream.close();

    if (report_stream.fail() ||
        std::rename(temporary_filename.c_str(), report_filename.c_str()) != 0)
    {
        log.write("Cannot replace report file " + report_filename);
        unlink(temporary_filename.c_str());
    }
}

//=============================================================================================
// Stops scanning, frees resources and triggers program shutdown at the end of the current
// frame
//=============================================================================================
void PosixDistanceMonitorImpl::shutdown()
{
    if (is_shut_down)
    {
        return;
    }
    is_shut_down = true;

    // Long enough for a scan that has just started to run out all of its source timeouts,
    // since the scan thread uses everything this class owns
    if (scan_scheduler &&
        !scan_scheduler->stop(ScanScheduler::DEFAULT_STOP_GRACE_PERIOD + longestScan()))
    {
        log.write("Scanning did not stop within its timeouts");
    }

    // Log that the service is stopping
    log.write("Service stopping");

    log.closeFile();

    // Delete the PID file
    unlink(pid_filename.c_str());

    // Signal that we should stop running
    setTerminate(true);
}

//=============================================================================================
// Writes the PID of the calling process to file
//=============================================================================================
void PosixDistanceMonitorImpl::writePidToFile(const std::string& pid_filename)
{
    std::ofstream out_stream(pid_filename.c_str());
    out_stream << getpid() << "\n";
    out_stream.close();
}
