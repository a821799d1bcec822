#ifndef DHCPWIRE_MESSAGE_H
#define DHCPWIRE_MESSAGE_H
#include <optional>
#include <iostream>
#include <string>
#include <array>
#include "address.h"
#include "options.h"
#include "buffer.h"
#include "config.h"
#include "fields.h"

namespace dhcpwire {
typedef std::array<uint8_t, 4> magic_type;

class message_builder;

// A DHCP/BOOTP message (RFC 2131, section 2).
//
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +---------------+---------------+---------------+---------------+
// |     op (1)    |   htype (1)   |   hlen (1)    |   hops (1)    |
// +---------------+---------------+---------------+---------------+
// |                            xid (4)                            |
// +-------------------------------+-------------------------------+
// |           secs (2)            |           flags (2)           |
// +-------------------------------+-------------------------------+
// |                          ciaddr  (4)                          |
// |                          yiaddr  (4)                          |
// |                          siaddr  (4)                          |
// |                          giaddr  (4)                          |
// +---------------------------------------------------------------+
// |                          chaddr  (16)                         |
// |                          sname   (64)                         |
// |                          file    (128)                        |
// +---------------------------------------------------------------+
// |                          magic   (4)                          |
// |                          options (variable)                   |
// +---------------------------------------------------------------+
//
// Header fields are fixed once the message is built; only the options
// can be changed afterwards.
class message
{
	public:
	static constexpr size_t sname_len = 64;
	static constexpr size_t file_len = 128;
	// op through file
	static constexpr size_t fixed_len = 236;
	static constexpr magic_type magic_cookie = {{ 0x63, 0x82, 0x53, 0x63 }};

	static message decode(gsl::span<const uint8_t> data, const codec_config& cfg = {});

	static message decode(const buffer& data, const codec_config& cfg = {})
	{ return decode(as_span(data), cfg); }

	// A client request of type `t`, for an Ethernet interface.
	static message request(message_type t, uint32_t xid, const mac_addr& hwaddr);

	// Appends the encoded message to `b`. Throws encode_error, leaving
	// `b` unchanged, if a string or option doesn't fit its field.
	void encode(buffer& b) const;
	buffer to_bytes() const;

	dhcpwire::opcode opcode() const
	{ return m_opcode; }

	const dhcpwire::htype& htype() const
	{ return m_htype; }

	uint8_t hlen() const
	{ return m_hlen; }

	uint8_t hops() const
	{ return m_hops; }

	uint32_t xid() const
	{ return m_xid; }

	uint16_t secs() const
	{ return m_secs; }

	dhcpwire::flags flags() const
	{ return m_flags; }

	const ip4_addr& ciaddr() const
	{ return m_ciaddr; }

	const ip4_addr& yiaddr() const
	{ return m_yiaddr; }

	const ip4_addr& siaddr() const
	{ return m_siaddr; }

	const ip4_addr& giaddr() const
	{ return m_giaddr; }

	const chaddr_type& chaddr() const
	{ return m_chaddr; }

	const std::optional<std::string>& sname() const
	{ return m_sname; }

	const std::optional<std::string>& file() const
	{ return m_file; }

	const magic_type& magic() const
	{ return m_magic; }

	const options& opts() const
	{ return m_opts; }

	options& opts()
	{ return m_opts; }

	bool operator==(const message& other) const;

	bool operator!=(const message& other) const
	{ return !operator==(other); }

	friend std::ostream& operator<<(std::ostream& os, const message& msg);

	private:
	friend class message_builder;

	message() = default;

	dhcpwire::opcode m_opcode = dhcpwire::opcode::boot_request;
	dhcpwire::htype m_htype = dhcpwire::htype::eth;
	uint8_t m_hlen = mac_addr::length;
	uint8_t m_hops = 0;
	uint32_t m_xid = 0;
	uint16_t m_secs = 0;
	dhcpwire::flags m_flags;
	ip4_addr m_ciaddr;
	ip4_addr m_yiaddr;
	ip4_addr m_siaddr;
	ip4_addr m_giaddr;
	chaddr_type m_chaddr = {};
	std::optional<std::string> m_sname;
	std::optional<std::string> m_file;
	magic_type m_magic = magic_cookie;
	options m_opts;
};

// Builds a message in memory. Unset fields default to a BOOTREQUEST
// from an Ethernet client with all addresses zero, no sname/file, the
// standard magic cookie and no options.
class message_builder
{
	public:
	message_builder() = default;

	message_builder& opcode(dhcpwire::opcode op)
	{ m_msg.m_opcode = op; return *this; }

	message_builder& htype(const dhcpwire::htype& h)
	{ m_msg.m_htype = h; return *this; }

	message_builder& hlen(uint8_t n)
	{ m_msg.m_hlen = n; return *this; }

	message_builder& hops(uint8_t n)
	{ m_msg.m_hops = n; return *this; }

	message_builder& xid(uint32_t id)
	{ m_msg.m_xid = id; return *this; }

	message_builder& secs(uint16_t s)
	{ m_msg.m_secs = s; return *this; }

	message_builder& flags(dhcpwire::flags f)
	{ m_msg.m_flags = f; return *this; }

	message_builder& ciaddr(const ip4_addr& a)
	{ m_msg.m_ciaddr = a; return *this; }

	message_builder& yiaddr(const ip4_addr& a)
	{ m_msg.m_yiaddr = a; return *this; }

	message_builder& siaddr(const ip4_addr& a)
	{ m_msg.m_siaddr = a; return *this; }

	message_builder& giaddr(const ip4_addr& a)
	{ m_msg.m_giaddr = a; return *this; }

	message_builder& chaddr(const chaddr_type& a)
	{ m_msg.m_chaddr = a; return *this; }

	// sets chaddr and hlen
	message_builder& chaddr(const mac_addr& a);

	message_builder& sname(std::optional<std::string> s)
	{ m_msg.m_sname = std::move(s); return *this; }

	message_builder& file(std::optional<std::string> f)
	{ m_msg.m_file = std::move(f); return *this; }

	message_builder& magic(const magic_type& m)
	{ m_msg.m_magic = m; return *this; }

	message_builder& opt(option_code code, option_value value)
	{ m_msg.m_opts.add(code, std::move(value)); return *this; }

	message_builder& opts(options o)
	{ m_msg.m_opts = std::move(o); return *this; }

	message build() const
	{ return m_msg; }

	private:
	message m_msg;
};
}
#endif
