#if !defined HARDWARE_ADDRESS_HPP
#define HARDWARE_ADDRESS_HPP

#include <string>

// Hardware addresses are keyed by their canonical text form, six uppercase hex byte pairs
// separated by colons, e.g. "AA:BB:CC:DD:EE:FF"
namespace hardwareAddress
{
    // Converts six raw bytes into canonical form
    std::string format(const unsigned char* raw_address);

    // Accepts colon- or dash-separated addresses in either case; returns false if text isn't
    // a hardware address
    bool normalize(const std::string& text, std::string& canonical);

    // The first three byte pairs of a canonical address, e.g. "AA:BB:CC"
    std::string prefix(const std::string& canonical);
}

#endif
