#ifndef DHCPWIRE_OPTIONS_H
#define DHCPWIRE_OPTIONS_H
#include <optional>
#include <iostream>
#include <variant>
#include <utility>
#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include "address.h"
#include "buffer.h"
#include "config.h"
#include "fields.h"

namespace dhcpwire {
// Option codes, RFC 2132 and later. Any other value is valid too and
// is decoded as an opaque option.
enum class option_code : uint8_t
{
	pad = 0,
	subnet_mask = 1,
	time_offset = 2,
	router = 3,
	time_server = 4,
	name_server = 5,
	domain_name_server = 6,
	log_server = 7,
	cookie_server = 8,
	lpr_server = 9,
	impress_server = 10,
	resource_location_server = 11,
	host_name = 12,
	boot_file_size = 13,
	merit_dump_file = 14,
	domain_name = 15,
	swap_server = 16,
	root_path = 17,
	extensions_path = 18,
	ip_forwarding = 19,
	non_local_source_routing = 20,
	policy_filter = 21,
	max_datagram_reassembly_size = 22,
	default_ip_ttl = 23,
	path_mtu_aging_timeout = 24,
	path_mtu_plateau_table = 25,
	interface_mtu = 26,
	all_subnets_local = 27,
	broadcast_address = 28,
	perform_mask_discovery = 29,
	mask_supplier = 30,
	perform_router_discovery = 31,
	router_solicitation_address = 32,
	static_route = 33,
	trailer_encapsulation = 34,
	arp_cache_timeout = 35,
	ethernet_encapsulation = 36,
	tcp_default_ttl = 37,
	tcp_keepalive_interval = 38,
	tcp_keepalive_garbage = 39,
	nis_domain = 40,
	nis_servers = 41,
	ntp_servers = 42,
	vendor_specific = 43,
	netbios_name_servers = 44,
	netbios_dd_servers = 45,
	netbios_node_type = 46,
	netbios_scope = 47,
	x_font_servers = 48,
	x_display_managers = 49,
	requested_ip = 50,
	lease_time = 51,
	overload = 52,
	msg_type = 53,
	server_id = 54,
	parameter_request_list = 55,
	error_message = 56,
	max_message_size = 57,
	renewal_time = 58,
	rebinding_time = 59,
	vendor_class_id = 60,
	client_id = 61,
	netware_domain = 62,
	netware_option = 63,
	nisplus_domain = 64,
	nisplus_servers = 65,
	tftp_server_name = 66,
	bootfile_name = 67,
	mobile_ip_home_agent = 68,
	smtp_servers = 69,
	pop3_servers = 70,
	nntp_servers = 71,
	www_servers = 72,
	finger_servers = 73,
	irc_servers = 74,
	streettalk_servers = 75,
	stda_servers = 76,
	user_class = 77,
	rapid_commit = 80,
	client_fqdn = 81,
	relay_agent_info = 82,
	last_transaction_time = 91,
	posix_timezone = 100,
	tzdb_timezone = 101,
	ipv6_only_preferred = 108,
	captive_portal = 114,
	auto_config = 116,
	subnet_selection = 118,
	domain_search = 119,
	classless_static_route = 121,
	forcerenew_nonce_capable = 145,
	tftp_servers = 150,
	ms_classless_static_route = 249,
	wpad = 252,
	base_time = 152,
	start_time_of_state = 153,
	end = 255
};

std::ostream& operator<<(std::ostream& os, option_code code);

// Wire layout of an option's value.
enum class option_shape
{
	none,           // length 0, presence only
	boolean,        // 1 byte, 0 or 1
	u8,
	u16,
	u32,            // 4 byte unsigned, not a duration
	i32,
	seconds,        // 4 byte unsigned duration
	ip4,
	ip4_list,       // n * 4 bytes, n >= 1
	ip4_pair_list,  // n * 8 bytes, n >= 1
	u16_list,       // n * 2 bytes, n >= 1
	code_list,      // any number of option codes
	text,           // at least 1 byte of UTF-8, no terminator
	msg_type,       // 1 byte
	opaque          // anything
};

struct option_def
{
	option_code code;
	option_shape shape;
	const char* name;
};

// Returns nullptr for codes without a known layout.
const option_def* find_option_def(option_code code);

// Either the registered name, or "option-<code>".
std::string option_name(option_code code);

typedef std::chrono::duration<uint32_t> seconds;
typedef std::vector<uint8_t> opaque;

typedef std::variant<
	std::monostate,
	bool,
	uint8_t,
	uint16_t,
	uint32_t,
	int32_t,
	seconds,
	ip4_addr,
	std::vector<ip4_addr>,
	std::vector<ip4_pair>,
	std::vector<uint16_t>,
	std::vector<option_code>,
	std::string,
	message_type,
	opaque
> option_value;

std::ostream& operator<<(std::ostream& os, const option_value& value);

// Decodes the value bytes of option `code`. Bytes that don't fit the
// registered shape are returned as an opaque value, or rejected with
// content_error if `cfg.strict_options` is set.
option_value decode_option_value(option_code code, gsl::span<const uint8_t> data,
		const codec_config& cfg = {});

// Wire bytes of a value, without code and length.
buffer encode_option_value(const option_value& value);

// Ordered option list. Duplicates are kept in the order they were
// added or received; PAD and END are never stored.
class options
{
	public:
	typedef std::pair<option_code, option_value> entry;
	// read-only; PAD and END must never become entry codes
	typedef std::vector<entry>::const_iterator const_iterator;

	options() = default;

	options(std::initializer_list<entry> entries);

	options& add(option_code code, option_value value);
	// replaces the first entry with this code and drops any later ones,
	// or appends if there is none
	options& set(option_code code, option_value value);

	const option_value* get(option_code code) const;
	option_value* get(option_code code);

	template<class T> const T* get_as(option_code code) const
	{
		auto v = get(code);
		return v ? std::get_if<T>(v) : nullptr;
	}

	std::vector<const option_value*> get_all(option_code code) const;

	bool contains(option_code code) const
	{ return get(code) != nullptr; }

	// returns the number of entries removed
	size_t remove(option_code code);

	void clear()
	{ m_opts.clear(); }

	size_t size() const
	{ return m_opts.size(); }

	bool empty() const
	{ return m_opts.empty(); }

	const_iterator begin() const
	{ return m_opts.begin(); }

	const_iterator end() const
	{ return m_opts.end(); }

	std::optional<message_type> msg_type() const;

	// Reads options up to END, or to the end of the input. Bytes after
	// END are left unread.
	static options decode(reader& r, const codec_config& cfg = {});
	// Appends all options followed by END. On failure, `b` is left
	// unchanged.
	void encode(buffer& b) const;

	bool operator==(const options& other) const
	{ return m_opts == other.m_opts; }

	bool operator!=(const options& other) const
	{ return !operator==(other); }

	friend std::ostream& operator<<(std::ostream& os, const options& opts);

	private:
	static void check_code(option_code code);

	std::vector<entry> m_opts;
};
}
#endif
