#if !defined POSIX_ADDRESS_RESOLUTION_SOURCE_HPP
#define POSIX_ADDRESS_RESOLUTION_SOURCE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "AddressResolutionSource.hpp"

#include "MacAddress.hpp"
#include "RawSocket.hpp"
#include "arp_ipv4.h"
#include "ethernet_ii_header.h"

// Sweeps the subnet attached to an interface with broadcast ARP requests, collects the replies
// and looks up the hostnames of the devices that replied.  A query takes no longer than
// reply_timeout plus lookup_timeout.
class PosixAddressResolutionSource : public AddressResolutionSource
{
public:

    PosixAddressResolutionSource(const std::string&               interface_name,
                                 const std::chrono::milliseconds& reply_timeout,
                                 const std::chrono::milliseconds& lookup_timeout);

    virtual ~PosixAddressResolutionSource();

    virtual bool query(std::vector<AddressBinding>& bindings, std::string& error_message);

    // Computes the host addresses (host byte order) to query given this host's address and
    // netmask (host byte order).  Subnets larger than MAXIMUM_SWEEP_HOSTS are narrowed to the
    // block of that size containing this host.  This host's own address is left out.
    static void sweepTargets(std::uint32_t               own_ip,
                             std::uint32_t               netmask,
                             std::vector<std::uint32_t>& targets);

    // Reverse lookup of one network address; empty if there is no name
    typedef std::string (*HostnameLookup)(const std::string& network_address);

    // Looks up the hostname of each network address on a worker thread, waiting at most
    // timeout for all of them.  Returns false if the lookups didn't finish in time; whatever
    // was resolved by then is still returned, and the rest are abandoned.  Addresses without
    // a name are left out of hostnames.
    static bool resolveHostnames(const std::vector<std::string>&     network_addresses,
                                 HostnameLookup                      lookup,
                                 const std::chrono::milliseconds&    timeout,
                                 std::map<std::string, std::string>& hostnames);

    // Reads the interface's hardware address, IPv4 address and netmask (host byte order)
    static bool readInterfaceAddresses(const std::string& interface_name,
                                       MacAddress&        own_mac,
                                       std::uint32_t&     own_ip,
                                       std::uint32_t&     netmask,
                                       std::string&       error_message);

    static const unsigned int MAXIMUM_SWEEP_HOSTS = 1024;

private:

    // Lookups shared with a worker thread, which may outlive the call that started it
    struct HostnameLookupState
    {
        HostnameLookupState();

        std::mutex state_mutex;

        // Network address -> hostname
        std::map<std::string, std::string> hostnames;

        // Set when the caller has stopped waiting
        bool abandoned;
    };

    // Body of the lookup worker thread
    static void lookUpAll(std::vector<std::string>             network_addresses,
                          HostnameLookup                       lookup,
                          std::shared_ptr<HostnameLookupState> state);

    // Fills in the parts of arp_request common to all requests
    void initializeArpRequest(const MacAddress& own_mac, std::uint32_t own_ip);

    // Broadcasts one request per target
    void issueRequests(RawSocket& socket, const std::vector<std::uint32_t>& targets);

    // Reads replies addressed to own_mac until reply_timeout passes
    void collectReplies(RawSocket&                             socket,
                        const MacAddress&                      own_mac,
                        std::map<std::string, AddressBinding>& replies);

    // Reverse lookup of a network address; returns an empty string if there is no name
    static std::string lookupHostname(const std::string& network_address);

    std::string interface_name;

    std::chrono::milliseconds reply_timeout;

    std::chrono::milliseconds lookup_timeout;

    static const unsigned int ETHERNET_FRAME_LENGTH = 1514;

    // Replies are read into this buffer
    unsigned char frame_buffer[ETHERNET_FRAME_LENGTH];

    // Template ARP request, target fields rewritten for each request
    unsigned char arp_request[sizeof(ethernet_ii_header) + sizeof(arp_ipv4)];

    PosixAddressResolutionSource(const PosixAddressResolutionSource&);
    PosixAddressResolutionSource& operator=(const PosixAddressResolutionSource&);
};

#endif
