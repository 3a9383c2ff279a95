#if !defined IDENTITY_RESOLVER_HPP
#define IDENTITY_RESOLVER_HPP

#include <string>

// Best-effort description of what a device is
struct Identity
{
    // Empty if unknown
    std::string manufacturer;

    // Never empty; "Unknown Device" if nothing better is known
    std::string device_type;
};

// Guesses a device's identity from its hardware address and, if known, its hostname.  Must not
// fail; anything it can't work out is left empty.
class IdentityResolver
{
public:

    virtual ~IdentityResolver();

    virtual Identity resolve(const std::string& hardware_address,
                             const std::string& hostname) const = 0;

    // Device type of a device nothing is known about
    static const char* const UNKNOWN_DEVICE_TYPE;
};

#endif
