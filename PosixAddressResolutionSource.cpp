#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "PosixAddressResolutionSource.hpp"

#include "HardwareAddress.hpp"
#include "Ipv4Address.hpp"
#include "MacAddress.hpp"
#include "RawSocket.hpp"
#include "arp_ipv4.h"
#include "ethernet_ii_header.h"
#include "miscNetworking.hpp"

const unsigned int PosixAddressResolutionSource::MAXIMUM_SWEEP_HOSTS;
const unsigned int PosixAddressResolutionSource::ETHERNET_FRAME_LENGTH;

//=============================================================================================
PosixAddressResolutionSource::HostnameLookupState::HostnameLookupState() :
    abandoned(false)
{
}

//=============================================================================================
PosixAddressResolutionSource::PosixAddressResolutionSource(
    const std::string&               interface_name,
    const std::chrono::milliseconds& reply_timeout,
    const std::chrono::milliseconds& lookup_timeout) :
    interface_name(interface_name),
    reply_timeout(reply_timeout),
    lookup_timeout(lookup_timeout)
{
    if (interface_name.empty() || interface_name.length() >= IFNAMSIZ)
    {
        throw std::runtime_error("Invalid interface name \"" + interface_name + "\"");
    }

    std::memset(frame_buffer, 0, ETHERNET_FRAME_LENGTH);
    std::memset(arp_request,  0, sizeof(arp_request));
}

//=============================================================================================
PosixAddressResolutionSource::~PosixAddressResolutionSource()
{
}

//=============================================================================================
bool PosixAddressResolutionSource::query(std::vector<AddressBinding>& bindings,
                                         std::string&                 error_message)
{
    MacAddress    own_mac;
    std::uint32_t own_ip  = 0;
    std::uint32_t netmask = 0;

    if (!readInterfaceAddresses(interface_name, own_mac, own_ip, netmask, error_message))
    {
        return false;
    }

    std::vector<std::uint32_t> targets;
    sweepTargets(own_ip, netmask, targets);

    initializeArpRequest(own_mac, own_ip);

    // Replies keyed by hardware address; a device answering twice counts once
    std::map<std::string, AddressBinding> replies;

    try
    {
        RawSocket socket;
        socket.setInputInterface(interface_name);
        socket.setOutputInterface(interface_name);
        socket.disableBlocking();

        issueRequests(socket, targets);
        collectReplies(socket, own_mac, replies);
    }
    catch (std::runtime_error& ex)
    {
        error_message = "ARP sweep on " + interface_name + " failed: " + ex.what();
        return false;
    }

    // Name lookups wait until the reply window has closed so they can't eat into it
    std::vector<std::string> network_addresses;
    for (std::map<std::string, AddressBinding>::const_iterator i = replies.begin();
         i != replies.end();
         ++i)
    {
        network_addresses.push_back(i->second.network_address);
    }

    // Devices whose names aren't known in time are still reported, just without names
    std::map<std::string, std::string> hostnames;
    resolveHostnames(network_addresses, &lookupHostname, lookup_timeout, hostnames);

    for (std::map<std::string, AddressBinding>::iterator i = replies.begin();
         i != replies.end();
         ++i)
    {
        std::map<std::string, std::string>::const_iterator hostname =
            hostnames.find(i->second.network_address);
        if (hostname != hostnames.end())
        {
            i->second.hostname = hostname->second;
        }

        bindings.push_back(i->second);
    }

    return true;
}

//=============================================================================================
bool PosixAddressResolutionSource::resolveHostnames(
    const std::vector<std::string>&     network_addresses,
    HostnameLookup                      lookup,
    const std::chrono::milliseconds&    timeout,
    std::map<std::string, std::string>& hostnames)
{
    if (network_addresses.empty())
    {
        return true;
    }

    // A resolver that doesn't answer can block a lookup for much longer than the timeout, so
    // lookups run where they can be abandoned
    std::shared_ptr<HostnameLookupState> state(new HostnameLookupState());

    std::packaged_task<void()> task(
        std::bind(&PosixAddressResolutionSource::lookUpAll, network_addresses, lookup, state));
    std::future<void> lookups_done = task.get_future();
    std::thread lookup_thread(std::move(task));

    const bool finished = lookups_done.wait_for(timeout) == std::future_status::ready;

    if (finished)
    {
        lookup_thread.join();
    }
    else
    {
        lookup_thread.detach();
    }

    std::lock_guard<std::mutex> lock(state->state_mutex);
    state->abandoned = !finished;
    hostnames.insert(state->hostnames.begin(), state->hostnames.end());

    return finished;
}

//=============================================================================================
void PosixAddressResolutionSource::sweepTargets(std::uint32_t               own_ip,
                                                std::uint32_t               netmask,
                                                std::vector<std::uint32_t>& targets)
{
    // Narrow the sweep if the subnet is too large; the mask below covers exactly
    // MAXIMUM_SWEEP_HOSTS addresses
    const std::uint32_t narrowest_mask = ~static_cast<std::uint32_t>(MAXIMUM_SWEEP_HOSTS - 1);
    if (~netmask >= MAXIMUM_SWEEP_HOSTS)
    {
        netmask = narrowest_mask;
    }

    const std::uint32_t network   = own_ip & netmask;
    const std::uint32_t broadcast = network | ~netmask;

    // Point-to-point and /31 links have no host range to sweep
    if (broadcast - network < 2)
    {
        return;
    }

    for (std::uint32_t address = network + 1; address < broadcast; address++)
    {
        if (address != own_ip)
        {
            targets.push_back(address);
        }
    }
}

//=============================================================================================
bool PosixAddressResolutionSource::readInterfaceAddresses(const std::string& interface_name,
                                                          MacAddress&        own_mac,
                                                          std::uint32_t&     own_ip,
                                                          std::uint32_t&     netmask,
                                                          std::string&       error_message)
{
    Ipv4Address own_ip_address;

    try
    {
        miscNetworking::getMacAddress(interface_name,  own_mac);
        miscNetworking::getIpv4Address(interface_name, own_ip_address);
    }
    catch (std::runtime_error& ex)
    {
        error_message = "Unable to get addresses of " + interface_name + ": " + ex.what();
        return false;
    }

    unsigned char own_ip_raw[4];
    own_ip_address.DataField::writeRaw(own_ip_raw);
    own_ip = (static_cast<std::uint32_t>(own_ip_raw[0]) << 24) |
             (static_cast<std::uint32_t>(own_ip_raw[1]) << 16) |
             (static_cast<std::uint32_t>(own_ip_raw[2]) << 8)  |
              static_cast<std::uint32_t>(own_ip_raw[3]);

    // Getting the netmask requires a socket, doesn't matter what kind
    int sock_fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_IP);
    if (sock_fd == -1)
    {
        error_message = std::string("Unable to open socket: ") + std::strerror(errno);
        return false;
    }

    // Fill out an ifreq with name of the target interface
    ifreq iface;
    std::memset(&iface, 0, sizeof(iface));
    std::strncpy(iface.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);

    bool success = true;

    if (ioctl(sock_fd, SIOCGIFNETMASK, &iface) == -1)
    {
        error_message = "Unable to get netmask of " + interface_name + ": " +
            std::strerror(errno);
        success = false;
    }
    else
    {
        const sockaddr_in* address = reinterpret_cast<const sockaddr_in*>(&iface.ifr_netmask);
        netmask = ntohl(address->sin_addr.s_addr);
    }

    close(sock_fd);

    // An interface without an IPv4 address has no subnet to sweep
    if (success && own_ip == 0)
    {
        error_message = interface_name + " has no IPv4 address";
        success = false;
    }

    return success;
}

//=============================================================================================
void PosixAddressResolutionSource::initializeArpRequest(const MacAddress& own_mac,
                                                        std::uint32_t     own_ip)
{
    ethernet_ii_header* arp_req_eth_hdr = reinterpret_cast<ethernet_ii_header*>(arp_request);
    arp_ipv4* arp_req_arp =
        reinterpret_cast<arp_ipv4*>(arp_request + sizeof(ethernet_ii_header));

    // Broadcast
    std::memset(arp_req_eth_hdr->mac_destination, 0xff, 6);
    own_mac.DataField::writeRaw(arp_req_eth_hdr->mac_source);

    // Ethertype is ARP
    arp_req_eth_hdr->ethertype[0] = 0x08;
    arp_req_eth_hdr->ethertype[1] = 0x06;

    // Ethernet hardware, IPv4 protocol
    arp_req_arp->htype[0] = 0x00;
    arp_req_arp->htype[1] = 0x01;
    arp_req_arp->ptype[0] = 0x08;
    arp_req_arp->ptype[1] = 0x00;
    arp_req_arp->hlen[0] = 0x06;
    arp_req_arp->plen[0] = 0x04;

    // Operation is request
    arp_req_arp->oper[0] = 0x00;
    arp_req_arp->oper[1] = 0x01;

    own_mac.DataField::writeRaw(arp_req_arp->sha);

    const std::uint32_t own_ip_network = htonl(own_ip);
    std::memcpy(arp_req_arp->spa, &own_ip_network, 4);

    // Target hardware address is unknown, that's the point
    std::memset(arp_req_arp->tha, 0, 6);
}

//=============================================================================================
void PosixAddressResolutionSource::issueRequests(RawSocket&                        socket,
                                                 const std::vector<std::uint32_t>& targets)
{
    arp_ipv4* arp_req_arp =
        reinterpret_cast<arp_ipv4*>(arp_request + sizeof(ethernet_ii_header));

    for (std::vector<std::uint32_t>::const_iterator i = targets.begin();
         i != targets.end();
         ++i)
    {
        const std::uint32_t target_network = htonl(*i);
        std::memcpy(arp_req_arp->tpa, &target_network, 4);

        socket.write(arp_request, sizeof(ethernet_ii_header) + sizeof(arp_ipv4));
    }
}

//=============================================================================================
void PosixAddressResolutionSource::collectReplies(
    RawSocket&                             socket,
    const MacAddress&                      own_mac,
    std::map<std::string, AddressBinding>& replies)
{
    const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + reply_timeout;

    while (std::chrono::steady_clock::now() < deadline)
    {
        int bytes_read = socket.read(frame_buffer, ETHERNET_FRAME_LENGTH);

        // Nothing waiting, give the network a moment
        if (bytes_read <= 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        if (static_cast<unsigned int>(bytes_read) <
            sizeof(ethernet_ii_header) + sizeof(arp_ipv4))
        {
            continue;
        }

        const ethernet_ii_header* eth_frame =
            reinterpret_cast<const ethernet_ii_header*>(frame_buffer);
        const arp_ipv4* arp_packet =
            reinterpret_cast<const arp_ipv4*>(frame_buffer + sizeof(ethernet_ii_header));

        // Only ARP replies addressed to this host are interesting
        if (eth_frame->ethertype[0] != 0x08 || eth_frame->ethertype[1] != 0x06 ||
            arp_packet->oper[1] != 0x02 ||
            !(MacAddress(arp_packet->tha) == own_mac))
        {
            continue;
        }

        AddressBinding binding;
        binding.hardware_address = hardwareAddress::format(arp_packet->sha);

        std::ostringstream network_address;
        network_address << Ipv4Address(arp_packet->spa);
        binding.network_address = network_address.str();

        replies[binding.hardware_address] = binding;
    }
}

//=============================================================================================
void PosixAddressResolutionSource::lookUpAll(
    std::vector<std::string>             network_addresses,
    HostnameLookup                       lookup,
    std::shared_ptr<HostnameLookupState> state)
{
    for (std::vector<std::string>::const_iterator i = network_addresses.begin();
         i != network_addresses.end();
         ++i)
    {
        {
            std::lock_guard<std::mutex> lock(state->state_mutex);
            if (state->abandoned)
            {
                return;
            }
        }

        const std::string hostname = lookup(*i);

        if (!hostname.empty())
        {
            std::lock_guard<std::mutex> lock(state->state_mutex);
            state->hostnames[*i] = hostname;
        }
    }
}

//=============================================================================================
std::string PosixAddressResolutionSource::lookupHostname(const std::string& network_address)
{
    sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    if (inet_pton(AF_INET, network_address.c_str(), &address.sin_addr) != 1)
    {
        return std::string();
    }

    char hostname[NI_MAXHOST];
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&address), sizeof(address),
                    hostname, sizeof(hostname), 0, 0, NI_NAMEREQD) != 0)
    {
        return std::string();
    }

    return hostname;
}
