#ifndef DHCPWIRE_ADDRESS_H
#define DHCPWIRE_ADDRESS_H
#include <boost/asio/ip/address_v4.hpp>
#include <iostream>
#include <algorithm>
#include <cstdint>
#include <utility>
#include <string>
#include <array>

namespace dhcpwire {
typedef boost::asio::ip::address_v4 ip4_addr;
// address and mask, or destination and router (static routes)
typedef std::pair<ip4_addr, ip4_addr> ip4_pair;

// client hardware address field, always 16 bytes on the wire
typedef std::array<uint8_t, 16> chaddr_type;

// An Ethernet hardware address, as used in chaddr when htype is 1.
class mac_addr
{
	public:
	static constexpr size_t length = 6;

	mac_addr()
	{ m_addr.fill(0); }

	mac_addr(const uint8_t (&addr)[length])
	{ std::copy(addr, addr + length, m_addr.begin()); }

	// accepts "aa:bb:cc:dd:ee:ff" and "aa-bb-cc-dd-ee-ff"
	mac_addr(const std::string& addr);

	bool operator==(const mac_addr& other) const
	{ return m_addr == other.m_addr; }

	bool operator!=(const mac_addr& other) const
	{ return !operator==(other); }

	// zero padded to the width of the chaddr field
	chaddr_type to_chaddr() const;

	friend std::ostream& operator<<(std::ostream& os, const mac_addr& addr);

	private:
	std::array<uint8_t, length> m_addr;
};

// Formats the first `hlen` bytes of `chaddr` as colon separated hex.
// An `hlen` beyond the field width is clamped.
std::string chaddr_to_string(const chaddr_type& chaddr, uint8_t hlen);
}
#endif
