#include <cctype>
#include <cstdio>
#include <string>

#include "HardwareAddress.hpp"

//=============================================================================================
std::string hardwareAddress::format(const unsigned char* raw_address)
{
    char address_cstr[18];
    std::snprintf(address_cstr, sizeof(address_cstr), "%02X:%02X:%02X:%02X:%02X:%02X",
                  raw_address[0], raw_address[1], raw_address[2],
                  raw_address[3], raw_address[4], raw_address[5]);

    return address_cstr;
}

//=============================================================================================
bool hardwareAddress::normalize(const std::string& text, std::string& canonical)
{
    // Six pairs plus five separators
    if (text.length() != 17)
    {
        return false;
    }

    std::string result(17, ':');
    for (unsigned int i = 0; i < text.length(); i++)
    {
        const unsigned char current = static_cast<unsigned char>(text[i]);

        // Every third character is a separator
        if (i % 3 == 2)
        {
            if (current != ':' && current != '-')
            {
                return false;
            }
        }
        else if (!std::isxdigit(current))
        {
            return false;
        }
        else
        {
            result[i] = static_cast<char>(std::toupper(current));
        }
    }

    canonical = result;
    return true;
}

//=============================================================================================
std::string hardwareAddress::prefix(const std::string& canonical)
{
    return canonical.substr(0, 8);
}
