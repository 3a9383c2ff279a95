#if !defined FAKE_SOURCES_HPP
#define FAKE_SOURCES_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "AddressResolutionSource.hpp"
#include "IdentityResolver.hpp"
#include "RadioSignalSource.hpp"

// Reports whatever readings it's been given
class FakeRadioSignalSource : public RadioSignalSource
{
public:

    FakeRadioSignalSource() :
        fail(false),
        throw_on_query(false),
        throw_unrecognized(false),
        query_count(0),
        delay(0)
    {
    }

    virtual bool query(std::map<std::string, double>& signals, std::string& error_message)
    {
        query_count++;

        if (delay.count() > 0)
        {
            std::this_thread::sleep_for(delay);
        }

        if (throw_on_query)
        {
            throw std::runtime_error("Wireless adapter vanished");
        }

        if (throw_unrecognized)
        {
            throw 42;
        }

        if (fail)
        {
            error_message = "Simulated radio timeout";
            return false;
        }

        signals = readings;
        return true;
    }

    std::map<std::string, double> readings;

    bool fail;

    std::atomic<bool> throw_on_query;

    // Throws something that isn't a std::exception
    std::atomic<bool> throw_unrecognized;

    std::atomic<unsigned int> query_count;

    std::chrono::milliseconds delay;
};

// Reports whatever bindings it's been given
class FakeAddressResolutionSource : public AddressResolutionSource
{
public:

    FakeAddressResolutionSource() :
        fail(false),
        query_count(0),
        delay(0)
    {
    }

    virtual bool query(std::vector<AddressBinding>& bindings, std::string& error_message)
    {
        query_count++;

        if (delay.count() > 0)
        {
            std::this_thread::sleep_for(delay);
        }

        if (fail)
        {
            error_message = "Simulated ARP timeout";
            return false;
        }

        bindings.insert(bindings.end(), replies.begin(), replies.end());
        return true;
    }

    void addReply(const std::string& hardware_address,
                  const std::string& network_address,
                  const std::string& hostname = "")
    {
        AddressBinding binding;
        binding.hardware_address = hardware_address;
        binding.network_address  = network_address;
        binding.hostname         = hostname;

        replies.push_back(binding);
    }

    std::vector<AddressBinding> replies;

    bool fail;

    std::atomic<unsigned int> query_count;

    std::chrono::milliseconds delay;
};

// Identifies devices from tables the test fills in
class FakeIdentityResolver : public IdentityResolver
{
public:

    virtual Identity resolve(const std::string& hardware_address,
                             const std::string& hostname) const
    {
        Identity identity;
        identity.device_type = UNKNOWN_DEVICE_TYPE;

        std::map<std::string, std::string>::const_iterator manufacturer =
            manufacturers.find(hardware_address);
        if (manufacturer != manufacturers.end())
        {
            identity.manufacturer = manufacturer->second;
            identity.device_type  = manufacturer->second + " Device";
        }

        std::map<std::string, std::string>::const_iterator device_type =
            hostname_types.find(hostname);
        if (!hostname.empty() && device_type != hostname_types.end())
        {
            identity.device_type = device_type->second;
        }

        return identity;
    }

    // Hardware address -> manufacturer
    std::map<std::string, std::string> manufacturers;

    // Hostname -> device type
    std::map<std::string, std::string> hostname_types;
};

#endif
