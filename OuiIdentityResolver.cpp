#include <cctype>
#include <cstddef>
#include <string>

#include "OuiIdentityResolver.hpp"

#include "HardwareAddress.hpp"

namespace
{
    struct PrefixEntry
    {
        const char* prefix;
        const char* manufacturer;
    };

    // Earlier entries win where a prefix is listed more than once
    const PrefixEntry PREFIXES[] =
    {
        {"A8:5C:2C", "iPhone"},  {"AC:BC:32", "iPhone"},  {"AC:88:FD", "iPhone"},
        {"24:F6:77", "iPhone"},  {"F0:D1:A9", "iPhone"},  {"F8:27:93", "iPhone"},
        {"34:08:BC", "iPhone"},  {"58:B1:0F", "iPhone"},  {"A4:B8:05", "iPhone"},
        {"A4:67:06", "iPad"},    {"AC:FD:EC", "iPad"},    {"C8:3C:85", "iPad"},
        {"34:EE:16", "iPad"},    {"00:88:65", "iPad"},    {"04:15:52", "iPad"},
        {"8C:85:90", "MacBook"}, {"A4:83:E7", "MacBook"}, {"A8:86:DD", "MacBook"},
        {"F0:18:98", "MacBook"}, {"00:3E:E1", "MacBook"}, {"14:98:77", "MacBook"},
        {"40:4E:36", "Android"}, {"44:80:EB", "Android"}, {"70:BB:E9", "Android"},
        {"A8:9F:BA", "Android"}, {"F8:A3:4F", "Android"}, {"10:2C:6B", "Android"},
        {"94:76:B7", "Samsung"}, {"A0:82:1F", "Samsung"}, {"CC:07:AB", "Samsung"},
        {"F4:42:8F", "Samsung"}, {"00:12:47", "Samsung"}, {"08:D4:2B", "Samsung"},
        {"3C:5A:B4", "Google"},  {"54:60:09", "Google"},  {"F4:F5:E8", "Google"},
        {"08:9E:08", "Google"},  {"20:DF:B9", "Google"},  {"70:1A:04", "Google"},
        {"00:FC:8B", "Amazon"},  {"34:D2:70", "Amazon"},  {"40:B4:CD", "Amazon"},
        {"44:65:0D", "Amazon"},  {"50:F5:DA", "Amazon"},  {"68:37:E9", "Amazon"},
        {"00:0E:58", "Sonos"},   {"34:7E:5C", "Sonos"},   {"48:A6:B8", "Sonos"},
        {"54:2A:1B", "Sonos"},   {"5C:AA:FD", "Sonos"},   {"78:28:CA", "Sonos"},
        {"18:B4:30", "Nest"},    {"28:BC:18", "Nest"},    {"64:16:66", "Nest"},
        {"00:62:6E", "Ring"},    {"2C:AA:8E", "Ring"},    {"30:91:8F", "Ring"},
        {"5C:41:E6", "Ring"},    {"7C:64:56", "Ring"}
    };

    struct DeviceTypePattern
    {
        const char* device_type;

        // Terminated by a null entry
        const char* keywords[12];
    };

    const DeviceTypePattern DEVICE_TYPE_PATTERNS[] =
    {
        {"iPhone",         {"iphone", "apple-iphone", 0}},
        {"iPad",           {"ipad", "apple-ipad", 0}},
        {"MacBook",        {"macbook", "mbp", "mba", "mac-book", 0}},
        {"iMac",           {"imac", "apple-imac", 0}},
        {"Apple Watch",    {"watch", "apple-watch", 0}},
        {"Apple TV",       {"appletv", "apple-tv", 0}},
        {"Android Phone",  {"android", "samsung", "galaxy", "pixel", "oneplus", "huawei",
                            "xiaomi", "redmi", "oppo", "vivo", "realme", 0}},
        {"Android Tablet", {"galaxy-tab", "nexus-tablet", "pixel-tablet", 0}},
        {"Smart TV",       {"tv", "roku", "firetv", "fire-tv", "chromecast", "smart-tv",
                            "bravia", "vizio", "hisense", "television", 0}},
        {"Gaming Console", {"playstation", "ps4", "ps5", "xbox", "nintendo", "switch",
                            "gaming", 0}},
        {"Smart Speaker",  {"echo", "alexa", "homepod", "google-home", "nest-audio", "sonos",
                            "speaker", 0}},
        {"Smart Display",  {"echo-show", "nest-hub", "portal", "smart-display", "home-hub", 0}},
        {"Security Camera",{"camera", "cam", "ring", "nest-cam", "arlo", "wyze", "doorbell",
                            "surveillance", 0}},
        {"Laptop",         {"laptop", "notebook", "thinkpad", "dell", "hp", "lenovo", "acer",
                            "asus", "chromebook", "surface", 0}},
        {"Desktop",        {"desktop", "pc", "computer", "workstation", 0}},
        {"Network Device", {"router", "switch", "access-point", "ap", "bridge", "gateway",
                            "modem", "network", "wifi", "wireless", 0}},
        {"Smart Home Hub", {"hub", "smartthings", "home-assistant", "homekit", "zigbee",
                            "z-wave", 0}},
        {"Printer",        {"printer", "print", "scanner", "mfp", "officejet", "laserjet",
                            "epson", "canon", 0}},
        {"Media Device",   {"shield", "media-player", "streaming", "dvr", "tivo", 0}}
    };

    std::string toLower(const std::string& text)
    {
        std::string lowered(text);
        for (std::string::iterator i = lowered.begin(); i != lowered.end(); ++i)
        {
            *i = static_cast<char>(std::tolower(static_cast<unsigned char>(*i)));
        }

        return lowered;
    }
}

//=============================================================================================
OuiIdentityResolver::OuiIdentityResolver()
{
}

//=============================================================================================
OuiIdentityResolver::~OuiIdentityResolver()
{
}

//=============================================================================================
Identity OuiIdentityResolver::resolve(const std::string& hardware_address,
                                      const std::string& hostname) const
{
    Identity identity;
    identity.manufacturer = lookupManufacturer(hardware_address);
    identity.device_type  = guessDeviceType(hostname, identity.manufacturer);

    return identity;
}

//=============================================================================================
std::string OuiIdentityResolver::lookupManufacturer(const std::string& hardware_address)
{
    std::string canonical;
    if (!hardwareAddress::normalize(hardware_address, canonical))
    {
        return std::string();
    }

    const std::string prefix = hardwareAddress::prefix(canonical);

    for (std::size_t i = 0; i < sizeof(PREFIXES) / sizeof(PREFIXES[0]); i++)
    {
        if (prefix == PREFIXES[i].prefix)
        {
            return PREFIXES[i].manufacturer;
        }
    }

    return std::string();
}

//=============================================================================================
// A manufacturer naming a category outright wins.  Otherwise every category with a keyword in
// the hostname or manufacturer is a candidate and the longest (most specific) name is chosen.
//=============================================================================================
std::string OuiIdentityResolver::guessDeviceType(const std::string& hostname,
                                                 const std::string& manufacturer)
{
    if (hostname.empty() && manufacturer.empty())
    {
        return UNKNOWN_DEVICE_TYPE;
    }

    const std::size_t pattern_count =
        sizeof(DEVICE_TYPE_PATTERNS) / sizeof(DEVICE_TYPE_PATTERNS[0]);

    const std::string lowered_manufacturer = toLower(manufacturer);

    if (!manufacturer.empty())
    {
        for (std::size_t i = 0; i < pattern_count; i++)
        {
            if (toLower(DEVICE_TYPE_PATTERNS[i].device_type).find(lowered_manufacturer) !=
                std::string::npos)
            {
                return DEVICE_TYPE_PATTERNS[i].device_type;
            }
        }
    }

    const std::string search_text =
        hostname.empty() ? lowered_manufacturer : toLower(hostname + " " + manufacturer);

    std::string best_match;
    for (std::size_t i = 0; i < pattern_count; i++)
    {
        for (const char* const* keyword = DEVICE_TYPE_PATTERNS[i].keywords;
             *keyword != 0;
             ++keyword)
        {
            if (search_text.find(*keyword) != std::string::npos)
            {
                // Ties go to the earlier category
                if (std::string(DEVICE_TYPE_PATTERNS[i].device_type).length() >
                    best_match.length())
                {
                    best_match = DEVICE_TYPE_PATTERNS[i].device_type;
                }

                break;
            }
        }
    }

    if (!best_match.empty())
    {
        return best_match;
    }

    if (!manufacturer.empty())
    {
        return manufacturer + " Device";
    }

    return UNKNOWN_DEVICE_TYPE;
}
