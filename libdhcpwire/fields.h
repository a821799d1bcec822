#ifndef DHCPWIRE_FIELDS_H
#define DHCPWIRE_FIELDS_H
#include <optional>
#include <iostream>
#include <variant>
#include <cstdint>
#include <string>

namespace dhcpwire {
enum class opcode : uint8_t
{
	boot_request = 1,
	boot_reply = 2
};

// throws structure_error for anything but 1 or 2
opcode opcode_from_u8(uint8_t value);
std::ostream& operator<<(std::ostream& os, opcode op);

// Hardware address type (RFC 3232, IANA ARP parameters). Types
// without a name here are kept as their raw value.
class htype
{
	public:
	enum kind : uint8_t
	{
		eth = 1,
		exp_eth = 2,
		ax25 = 3,
		pro_token = 4,
		chaos = 5,
		ieee802 = 6,
		arcnet = 7,
		hyperchannel = 8,
		lanstar = 9,
		autonet = 10,
		localtalk = 11,
		localnet = 12,
		ultralink = 13,
		smds = 14,
		frame_relay = 15,
		atm16 = 16,
		hdlc = 17,
		fibre_channel = 18,
		atm19 = 19,
		serial_line = 20,
		atm21 = 21,
		mil_std_188_220 = 22,
		metricom = 23,
		ieee1394 = 24,
		mapos = 25,
		twinaxial = 26,
		eui64 = 27,
		hiparp = 28,
		iso7816 = 29,
		arpsec = 30,
		ipsec = 31,
		infiniband = 32,
	};

	// values without a name are stored as unknown
	htype(kind k = eth);

	static htype from_u8(uint8_t value);

	uint8_t to_u8() const;

	bool is_known() const
	{ return std::holds_alternative<kind>(m_value); }

	std::optional<kind> known() const;

	std::string name() const;

	bool operator==(const htype& other) const
	{ return to_u8() == other.to_u8(); }

	bool operator!=(const htype& other) const
	{ return !operator==(other); }

	friend std::ostream& operator<<(std::ostream& os, const htype& h)
	{ return os << h.name(); }

	private:
	struct unknown
	{
		uint8_t value;
	};

	std::variant<kind, unknown> m_value;
};

// The 16-bit flags field. Bit 15 is BROADCAST, the remaining bits are
// reserved but kept as received.
class flags
{
	public:
	static constexpr uint16_t broadcast_bit = 0x8000;

	explicit flags(uint16_t raw = 0)
	: m_raw(raw)
	{}

	bool broadcast() const
	{ return m_raw & broadcast_bit; }

	flags& broadcast(bool b)
	{
		m_raw = b ? (m_raw | broadcast_bit) : reserved();
		return *this;
	}

	uint16_t reserved() const
	{ return m_raw & uint16_t(~broadcast_bit); }

	uint16_t raw() const
	{ return m_raw; }

	bool operator==(const flags& other) const
	{ return m_raw == other.m_raw; }

	bool operator!=(const flags& other) const
	{ return !operator==(other); }

	friend std::ostream& operator<<(std::ostream& os, const flags& f);

	private:
	uint16_t m_raw;
};

// Value of option 53. Values outside the named range are kept.
enum class message_type : uint8_t
{
	discover = 1,
	offer = 2,
	request = 3,
	decline = 4,
	ack = 5,
	nak = 6,
	release = 7,
	inform = 8,
	force_renew = 9,
	lease_query = 10,
	lease_unassigned = 11,
	lease_unknown = 12,
	lease_active = 13,
	bulk_lease_query = 14,
	lease_query_done = 15,
	active_lease_query = 16,
	lease_query_status = 17,
	tls = 18,
};

std::string message_type_name(message_type t);
std::ostream& operator<<(std::ostream& os, message_type t);
}
#endif
