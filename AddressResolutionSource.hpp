#if !defined ADDRESS_RESOLUTION_SOURCE_HPP
#define ADDRESS_RESOLUTION_SOURCE_HPP

#include <string>
#include <vector>

// One hardware address found to be using a network address
struct AddressBinding
{
    // Canonical uppercase colon-separated form
    std::string hardware_address;

    std::string network_address;

    // Reverse lookup of network_address; empty if there wasn't one
    std::string hostname;
};

// Sweeps the local subnet to learn which hardware addresses are using which network addresses
class AddressResolutionSource
{
public:

    virtual ~AddressResolutionSource() {}

    // Appends every binding found to bindings.  Must return within a bounded time.  Returns
    // false if the sweep failed, in which case error_message says why and bindings should be
    // treated as empty.
    virtual bool query(std::vector<AddressBinding>& bindings,
                       std::string&                 error_message) = 0;
};

#endif
