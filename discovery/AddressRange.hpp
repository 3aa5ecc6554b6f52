#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fleet_ops::discovery
{
    // Fatal to one scan cycle only; the coordinator logs it and retries next period.
    class ScanError : public std::runtime_error
    {
    public:
        explicit ScanError(const std::string &what) : std::runtime_error(what) {}
    };

    // IPv4 block in host byte order.
    struct AddressRange
    {
        uint32_t network = 0;
        int prefix = 32;

        uint64_t HostCount() const;
        uint32_t HostAt(uint64_t index) const;
        std::string ToString() const;
    };

    // "a.b.c.d/n" or a bare address (/32). Host bits are masked off.
    AddressRange ParseCidr(const std::string &cidr);

    // Network of the default-route interface, assumed /24.
    AddressRange DeriveLocalRange();

    std::string IpToString(uint32_t ip);
}
