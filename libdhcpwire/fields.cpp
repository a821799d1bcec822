#include <boost/format.hpp>
#include "fields.h"
#include "errors.h"
#include "util.h"
using namespace std;

namespace dhcpwire {
namespace {
// indexed by hardware type, see htype::kind
const char* htype_names[] =
{
	nullptr,
	"Ethernet",
	"Experimental Ethernet",
	"AX.25",
	"ProNET Token Ring",
	"Chaos",
	"IEEE 802",
	"ARCNET",
	"Hyperchannel",
	"Lanstar",
	"Autonet Short Address",
	"LocalTalk",
	"LocalNet",
	"Ultra link",
	"SMDS",
	"Frame Relay",
	"ATM",
	"HDLC",
	"Fibre Channel",
	"ATM",
	"Serial Line",
	"ATM",
	"MIL-STD-188-220",
	"Metricom",
	"IEEE 1394.1995",
	"MAPOS",
	"Twinaxial",
	"EUI-64",
	"HIPARP",
	"IP and ARP over ISO 7816-3",
	"ARPSec",
	"IPsec tunnel",
	"InfiniBand",
};

constexpr auto htype_count = sizeof(htype_names) / sizeof(htype_names[0]);

const char* message_type_names[] =
{
	nullptr,
	"DHCPDISCOVER",
	"DHCPOFFER",
	"DHCPREQUEST",
	"DHCPDECLINE",
	"DHCPACK",
	"DHCPNAK",
	"DHCPRELEASE",
	"DHCPINFORM",
	"DHCPFORCERENEW",
	"DHCPLEASEQUERY",
	"DHCPLEASEUNASSIGNED",
	"DHCPLEASEUNKNOWN",
	"DHCPLEASEACTIVE",
	"DHCPBULKLEASEQUERY",
	"DHCPLEASEQUERYDONE",
	"DHCPACTIVELEASEQUERY",
	"DHCPLEASEQUERYSTATUS",
	"DHCPTLS",
};

constexpr auto message_type_count = sizeof(message_type_names) / sizeof(message_type_names[0]);
}

opcode opcode_from_u8(uint8_t value)
{
	switch (value) {
		case to_underlying(opcode::boot_request):
			return opcode::boot_request;
		case to_underlying(opcode::boot_reply):
			return opcode::boot_reply;
		default:
			throw structure_error("invalid opcode: " + to_string(value));
	}
}

ostream& operator<<(ostream& os, opcode op)
{
	switch (op) {
		case opcode::boot_request:
			return os << "BOOTREQUEST";
		case opcode::boot_reply:
			return os << "BOOTREPLY";
	}

	return os << int(to_underlying(op));
}

htype::htype(kind k)
{
	if (k < htype_count && htype_names[k]) {
		m_value = k;
	} else {
		m_value = unknown { k };
	}
}

htype htype::from_u8(uint8_t value)
{
	return htype(static_cast<kind>(value));
}

uint8_t htype::to_u8() const
{
	if (auto k = std::get_if<kind>(&m_value)) {
		return *k;
	}

	return std::get<unknown>(m_value).value;
}

optional<htype::kind> htype::known() const
{
	if (auto k = std::get_if<kind>(&m_value)) {
		return *k;
	}

	return nullopt;
}

string htype::name() const
{
	auto v = to_u8();
	if (is_known() && v < htype_count && htype_names[v]) {
		return htype_names[v];
	}

	return "unknown (" + to_string(v) + ")";
}

ostream& operator<<(ostream& os, const flags& f)
{
	os << boost::format("0x%04x") % f.raw();
	if (f.broadcast()) {
		os << " (broadcast)";
	}
	return os;
}

string message_type_name(message_type t)
{
	auto v = to_underlying(t);
	if (v < message_type_count && message_type_names[v]) {
		return message_type_names[v];
	}

	return "unknown (" + to_string(v) + ")";
}

ostream& operator<<(ostream& os, message_type t)
{
	return os << message_type_name(t);
}
}
