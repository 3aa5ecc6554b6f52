#include "AddressRange.hpp"
#include <tins/tins.h>
#include <arpa/inet.h>
#include <cctype>

namespace fleet_ops::discovery
{
    namespace
    {
        uint32_t MaskFor(int prefix)
        {
            return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
        }

        uint32_t StringToIp(const std::string &text)
        {
            in_addr addr{};
            if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
                throw ScanError("Invalid IPv4 address '" + text + "'");
            return ntohl(addr.s_addr);
        }
    }

    std::string IpToString(uint32_t ip)
    {
        in_addr addr{};
        addr.s_addr = htonl(ip);
        char buffer[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
        return buffer;
    }

    uint64_t AddressRange::HostCount() const
    {
        if (prefix >= 31)
            return prefix == 32 ? 1 : 2;
        return (uint64_t{1} << (32 - prefix)) - 2;
    }

    // /31 and /32 have no network or broadcast address to skip.
    uint32_t AddressRange::HostAt(uint64_t index) const
    {
        if (prefix >= 31)
            return network + static_cast<uint32_t>(index);
        return network + 1 + static_cast<uint32_t>(index);
    }

    std::string AddressRange::ToString() const
    {
        return IpToString(network) + "/" + std::to_string(prefix);
    }

    AddressRange ParseCidr(const std::string &cidr)
    {
        if (cidr.empty())
            throw ScanError("Empty scan range");

        std::string ip_part = cidr;
        int prefix = 32;

        std::size_t slash = cidr.find('/');
        if (slash != std::string::npos)
        {
            ip_part = cidr.substr(0, slash);
            std::string prefix_part = cidr.substr(slash + 1);

            if (prefix_part.empty() || prefix_part.size() > 2)
                throw ScanError("Invalid prefix length in '" + cidr + "'");
            for (char c : prefix_part)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    throw ScanError("Invalid prefix length in '" + cidr + "'");
            }

            prefix = std::stoi(prefix_part);
            if (prefix > 32)
                throw ScanError("Prefix length out of range in '" + cidr + "'");
        }

        AddressRange range;
        range.prefix = prefix;
        range.network = StringToIp(ip_part) & MaskFor(prefix);
        return range;
    }

    AddressRange DeriveLocalRange()
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();
            return ParseCidr(info.ip_addr.to_string() + "/24");
        }
        catch (const ScanError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw ScanError(std::string("Cannot derive local network: ") + e.what());
        }
    }
}
