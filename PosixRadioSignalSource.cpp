#include <cctype>
#include <cstdio>
#include <istream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/wait.h>

#include "PosixRadioSignalSource.hpp"

#include "HardwareAddress.hpp"

const int PosixRadioSignalSource::TIMEOUT_STATUS = 124;
const int PosixRadioSignalSource::KILLED_STATUS  = 137;

//=============================================================================================
PosixRadioSignalSource::PosixRadioSignalSource(const std::string& interface_name,
                                               Mode               mode,
                                               unsigned int       timeout_seconds) :
    interface_name(interface_name),
    mode(mode),
    timeout_seconds(timeout_seconds)
{
    // The interface name ends up on a shell command line, so be strict about it
    if (interface_name.empty())
    {
        throw std::runtime_error("No wireless interface specified");
    }

    for (std::string::const_iterator i = interface_name.begin();
         i != interface_name.end();
         ++i)
    {
        if (!std::isalnum(static_cast<unsigned char>(*i)) &&
            *i != '_' && *i != '-' && *i != '.')
        {
            throw std::runtime_error("Invalid wireless interface name " + interface_name);
        }
    }

    if (timeout_seconds == 0)
    {
        throw std::runtime_error("Radio scan timeout must be at least one second");
    }
}

//=============================================================================================
PosixRadioSignalSource::~PosixRadioSignalSource()
{
}

//=============================================================================================
bool PosixRadioSignalSource::query(std::map<std::string, double>& signals,
                                   std::string&                   error_message)
{
    FILE* pipe = popen(buildCommand().c_str(), "r");
    if (!pipe)
    {
        error_message = "Unable to run iw";
        return false;
    }

    // Collect everything before parsing so the child is reaped promptly
    std::string output;
    char line_buffer[256];
    while (std::fgets(line_buffer, sizeof(line_buffer), pipe) != 0)
    {
        output += line_buffer;
    }

    int status = pclose(pipe);

    if (status == -1)
    {
        error_message = "Unable to retrieve iw exit status";
        return false;
    }

    if (WIFSIGNALED(status) ||
        (WIFEXITED(status) && (WEXITSTATUS(status) == TIMEOUT_STATUS ||
                               WEXITSTATUS(status) == KILLED_STATUS)))
    {
        std::ostringstream error_stream;
        error_stream << "Radio scan on " << interface_name << " timed out after "
                     << timeout_seconds << "s";
        error_message = error_stream.str();
        return false;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        std::ostringstream error_stream;
        error_stream << "Radio scan on " << interface_name << " failed with status "
                     << WEXITSTATUS(status);
        error_message = error_stream.str();
        return false;
    }

    std::istringstream output_stream(output);
    parseOutput(output_stream, signals);

    return true;
}

//=============================================================================================
// Both output formats consist of a header line naming the peer ("BSS <mac>(on wlan0)" or
// "Station <mac> (on wlan0)") followed by indented attribute lines, one of which is
// "signal: <dBm> ..."
//=============================================================================================
unsigned int PosixRadioSignalSource::parseOutput(std::istream&                  output,
                                                 std::map<std::string, double>& signals)
{
    unsigned int readings = 0;

    // Canonical address of the peer currently being described; empty if the current header
    // couldn't be parsed
    std::string current_address;
    bool current_has_signal = false;

    std::string line;
    while (std::getline(output, line))
    {
        // Trim leading whitespace
        std::string::size_type start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
        {
            continue;
        }
        std::string trimmed = line.substr(start);

        // Is this a header?  Headers aren't indented.
        if (start == 0 &&
            (trimmed.compare(0, 4, "BSS ") == 0 || trimmed.compare(0, 8, "Station ") == 0))
        {
            std::string::size_type address_start = trimmed.find(' ') + 1;

            current_has_signal = false;
            if (!hardwareAddress::normalize(trimmed.substr(address_start, 17), current_address))
            {
                current_address.clear();
            }

            continue;
        }

        // Only the first "signal:" line of a peer counts; "signal avg:" is a different line
        if (current_address.empty() ||
            current_has_signal ||
            trimmed.compare(0, 7, "signal:") != 0)
        {
            continue;
        }

        std::istringstream convert_to_number(trimmed.substr(7));
        double signal = 0.0;
        convert_to_number >> signal;

        if (!convert_to_number.fail())
        {
            signals[current_address] = signal;
            current_has_signal = true;
            readings++;
        }
    }

    return readings;
}

//=============================================================================================
bool PosixRadioSignalSource::parseMode(const std::string& text, Mode& mode)
{
    if (text == "scan")
    {
        mode = SCAN;
    }
    else if (text == "station")
    {
        mode = STATION_DUMP;
    }
    else
    {
        return false;
    }

    return true;
}

//=============================================================================================
std::string PosixRadioSignalSource::buildCommand() const
{
    std::ostringstream command;
    command << "timeout -s KILL " << timeout_seconds << " iw dev " << interface_name
            << (mode == SCAN ? " scan" : " station dump") << " 2>/dev/null";

    return command.str();
}
