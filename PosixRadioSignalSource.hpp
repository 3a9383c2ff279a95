#if !defined POSIX_RADIO_SIGNAL_SOURCE_HPP
#define POSIX_RADIO_SIGNAL_SOURCE_HPP

#include <istream>
#include <map>
#include <string>

#include "RadioSignalSource.hpp"

// Gets signal strengths from the "iw" utility, run under "timeout" so a wedged adapter can't
// stall the caller
class PosixRadioSignalSource : public RadioSignalSource
{
public:

    enum Mode
    {
        // Access points visible to the adapter ("iw dev <interface> scan")
        SCAN,

        // Stations associated with the adapter when it's an access point
        // ("iw dev <interface> station dump")
        STATION_DUMP
    };

    PosixRadioSignalSource(const std::string& interface_name,
                           Mode               mode,
                           unsigned int       timeout_seconds);

    virtual ~PosixRadioSignalSource();

    virtual bool query(std::map<std::string, double>& signals, std::string& error_message);

    // Parses iw scan or station dump output; returns the number of readings parsed
    static unsigned int parseOutput(std::istream& output, std::map<std::string, double>& signals);

    // Translates a RADIO_SCAN_MODE setting; returns false if it isn't recognized
    static bool parseMode(const std::string& text, Mode& mode);

private:

    // Builds the shell command to run
    std::string buildCommand() const;

    std::string interface_name;

    Mode mode;

    unsigned int timeout_seconds;

    // Exit status coreutils timeout uses when it had to kill the command
    static const int TIMEOUT_STATUS;
    static const int KILLED_STATUS;

    PosixRadioSignalSource(const PosixRadioSignalSource&);
    PosixRadioSignalSource& operator=(const PosixRadioSignalSource&);
};

#endif
