#if !defined RADIO_SIGNAL_SOURCE_HPP
#define RADIO_SIGNAL_SOURCE_HPP

#include <map>
#include <string>

// Reports the signal strength of every peer the wireless adapter can currently see
class RadioSignalSource
{
public:

    virtual ~RadioSignalSource() {}

    // Fills signals with canonical hardware address -> signal strength in dBm.  Must return
    // within a bounded time.  Returns false if the query failed or timed out, in which case
    // error_message says why and signals should be treated as empty.
    virtual bool query(std::map<std::string, double>& signals,
                       std::string&                   error_message) = 0;
};

#endif
