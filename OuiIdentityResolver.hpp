#if !defined OUI_IDENTITY_RESOLVER_HPP
#define OUI_IDENTITY_RESOLVER_HPP

#include <string>

#include "IdentityResolver.hpp"

// Identifies devices using built-in tables of hardware address prefixes and hostname keywords
class OuiIdentityResolver : public IdentityResolver
{
public:

    OuiIdentityResolver();
    virtual ~OuiIdentityResolver();

    virtual Identity resolve(const std::string& hardware_address,
                             const std::string& hostname) const;

    // Manufacturer registered for the address's prefix, or an empty string
    static std::string lookupManufacturer(const std::string& hardware_address);

    // Category best matching the hostname and manufacturer
    static std::string guessDeviceType(const std::string& hostname,
                                       const std::string& manufacturer);
};

#endif
