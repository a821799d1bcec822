#include <boost/format.hpp>
#include <iomanip>
#include "message.h"
#include "util.h"
using namespace std;

namespace dhcpwire {
namespace {
void write_ip4(buffer& b, const ip4_addr& addr)
{
	pack<endian_big>(b, uint32_t(addr.to_uint()));
}

string magic_to_string(const magic_type& magic)
{
	return to_hex(gsl::span<const uint8_t>(magic.data(), magic.size()));
}
}

message message::decode(gsl::span<const uint8_t> data, const codec_config& cfg)
{
	reader r(data);
	message ret;

	ret.m_opcode = opcode_from_u8(r.read_u8());
	ret.m_htype = dhcpwire::htype::from_u8(r.read_u8());
	ret.m_hlen = r.read_u8();
	ret.m_hops = r.read_u8();
	ret.m_xid = r.read_u32();
	ret.m_secs = r.read_u16();
	ret.m_flags = dhcpwire::flags(r.read_u16());
	ret.m_ciaddr = ip4_addr(r.read_u32());
	ret.m_yiaddr = ip4_addr(r.read_u32());
	ret.m_siaddr = ip4_addr(r.read_u32());
	ret.m_giaddr = ip4_addr(r.read_u32());
	ret.m_chaddr = r.read_array<sizeof(chaddr_type)>();
	ret.m_sname = r.read_padded_string(sname_len);
	ret.m_file = r.read_padded_string(file_len);
	ret.m_magic = r.read_array<sizeof(magic_type)>();

	if (cfg.check_magic && ret.m_magic != magic_cookie) {
		throw not_dhcp_error("bad magic cookie: " + magic_to_string(ret.m_magic));
	}

	ret.m_opts = options::decode(r, cfg);
	return ret;
}

message message::request(message_type t, uint32_t xid, const mac_addr& hwaddr)
{
	return message_builder()
		.opcode(dhcpwire::opcode::boot_request)
		.htype(dhcpwire::htype::eth)
		.xid(xid)
		.chaddr(hwaddr)
		.opt(option_code::msg_type, t)
		.build();
}

void message::encode(buffer& b) const
{
	buffer ret;

	pack<endian_big>(ret, to_underlying(m_opcode));
	pack<endian_big>(ret, m_htype.to_u8());
	pack<endian_big>(ret, m_hlen);
	pack<endian_big>(ret, m_hops);
	pack<endian_big>(ret, m_xid);
	pack<endian_big>(ret, m_secs);
	pack<endian_big>(ret, m_flags.raw());
	write_ip4(ret, m_ciaddr);
	write_ip4(ret, m_yiaddr);
	write_ip4(ret, m_siaddr);
	write_ip4(ret, m_giaddr);
	append(ret, m_chaddr);
	write_padded_string(ret, m_sname, sname_len);
	write_padded_string(ret, m_file, file_len);
	append(ret, m_magic);
	m_opts.encode(ret);

	b += ret;
}

buffer message::to_bytes() const
{
	buffer ret;
	encode(ret);
	return ret;
}

bool message::operator==(const message& other) const
{
	return m_opcode == other.m_opcode
		&& m_htype == other.m_htype
		&& m_hlen == other.m_hlen
		&& m_hops == other.m_hops
		&& m_xid == other.m_xid
		&& m_secs == other.m_secs
		&& m_flags == other.m_flags
		&& m_ciaddr == other.m_ciaddr
		&& m_yiaddr == other.m_yiaddr
		&& m_siaddr == other.m_siaddr
		&& m_giaddr == other.m_giaddr
		&& m_chaddr == other.m_chaddr
		&& m_sname == other.m_sname
		&& m_file == other.m_file
		&& m_magic == other.m_magic
		&& m_opts == other.m_opts;
}

ostream& operator<<(ostream& os, const message& msg)
{
	auto type = msg.opts().msg_type();

	os << msg.opcode();
	if (type) {
		os << " " << *type;
	}
	os << boost::format(", xid 0x%08x") % msg.xid() << endl;

	os << "  htype " << msg.htype() << ", hlen " << int(msg.hlen())
		<< ", hops " << int(msg.hops()) << ", secs " << msg.secs()
		<< ", flags " << msg.flags() << endl;
	os << "  ciaddr " << msg.ciaddr() << ", yiaddr " << msg.yiaddr()
		<< ", siaddr " << msg.siaddr() << ", giaddr " << msg.giaddr() << endl;
	os << "  chaddr " << chaddr_to_string(msg.chaddr(), msg.hlen()) << endl;

	if (msg.sname()) {
		os << "  sname " << quoted(*msg.sname()) << endl;
	}

	if (msg.file()) {
		os << "  file " << quoted(*msg.file()) << endl;
	}

	if (msg.magic() != message::magic_cookie) {
		os << "  magic " << magic_to_string(msg.magic()) << endl;
	}

	return os << msg.opts();
}

message_builder& message_builder::chaddr(const mac_addr& a)
{
	m_msg.m_chaddr = a.to_chaddr();
	m_msg.m_hlen = mac_addr::length;
	return *this;
}
}
