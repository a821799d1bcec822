#include <boost/algorithm/string.hpp>
#include <boost/range/adaptors.hpp>
#include <algorithm>
#include <iterator>
#include <array>
#include "options.h"
#include "util.h"
using namespace std;

namespace dhcpwire {
namespace {
typedef option_shape s;
typedef option_code c;

// http://www.iana.org/assignments/bootp-dhcp-parameters/bootp-dhcp-parameters.xhtml
const option_def option_defs[] =
{
	{ c::subnet_mask,                  s::ip4,            "subnet-mask" },
	{ c::time_offset,                  s::i32,            "time-offset" },
	{ c::router,                       s::ip4_list,       "routers" },
	{ c::time_server,                  s::ip4_list,       "time-servers" },
	{ c::name_server,                  s::ip4_list,       "name-servers" },
	{ c::domain_name_server,           s::ip4_list,       "domain-name-servers" },
	{ c::log_server,                   s::ip4_list,       "log-servers" },
	{ c::cookie_server,                s::ip4_list,       "cookie-servers" },
	{ c::lpr_server,                   s::ip4_list,       "lpr-servers" },
	{ c::impress_server,               s::ip4_list,       "impress-servers" },
	{ c::resource_location_server,     s::ip4_list,       "resource-location-servers" },
	{ c::host_name,                    s::text,           "hostname" },
	{ c::boot_file_size,               s::u16,            "boot-file-size" },
	{ c::merit_dump_file,              s::text,           "merit-dump-file" },
	{ c::domain_name,                  s::text,           "domain-name" },
	{ c::swap_server,                  s::ip4,            "swap-server" },
	{ c::root_path,                    s::text,           "root-path" },
	{ c::extensions_path,              s::text,           "extensions-path" },
	{ c::ip_forwarding,                s::boolean,        "ip-forwarding" },
	{ c::non_local_source_routing,     s::boolean,        "non-local-source-routing" },
	{ c::policy_filter,                s::ip4_pair_list,  "policy-filters" },
	{ c::max_datagram_reassembly_size, s::u16,            "maximum-datagram-reassembly-size" },
	{ c::default_ip_ttl,               s::u8,             "ip-default-ttl" },
	{ c::path_mtu_aging_timeout,       s::seconds,        "path-mtu-aging-timeout" },
	{ c::path_mtu_plateau_table,       s::u16_list,       "path-mtu-plateau-table" },
	{ c::interface_mtu,                s::u16,            "interface-mtu" },
	{ c::all_subnets_local,            s::boolean,        "all-subnets-local" },
	{ c::broadcast_address,            s::ip4,            "broadcast-address" },
	{ c::perform_mask_discovery,       s::boolean,        "perform-mask-discovery" },
	{ c::mask_supplier,                s::boolean,        "mask-supplier" },
	{ c::perform_router_discovery,     s::boolean,        "perform-router-discovery" },
	{ c::router_solicitation_address,  s::ip4,            "router-solicitation-address" },
	{ c::static_route,                 s::ip4_pair_list,  "static-routes" },
	{ c::trailer_encapsulation,        s::boolean,        "trailer-encapsulation" },
	{ c::arp_cache_timeout,            s::seconds,        "arp-cache-timeout" },
	{ c::ethernet_encapsulation,       s::boolean,        "ethernet-encapsulation" },
	{ c::tcp_default_ttl,              s::u8,             "tcp-default-ttl" },
	{ c::tcp_keepalive_interval,       s::seconds,        "tcp-keepalive-interval" },
	{ c::tcp_keepalive_garbage,        s::boolean,        "tcp-keepalive-garbage" },
	{ c::nis_domain,                   s::text,           "nis-domain" },
	{ c::nis_servers,                  s::ip4_list,       "nis-servers" },
	{ c::ntp_servers,                  s::ip4_list,       "ntp-servers" },
	{ c::vendor_specific,              s::opaque,         "vendor-specific-information" },
	{ c::netbios_name_servers,         s::ip4_list,       "netbios-name-servers" },
	{ c::netbios_dd_servers,           s::ip4_list,       "netbios-dgram-distribution-servers" },
	{ c::netbios_node_type,            s::u8,             "netbios-node-type" },
	{ c::netbios_scope,                s::text,           "netbios-scope" },
	{ c::x_font_servers,               s::ip4_list,       "xwindow-font-servers" },
	{ c::x_display_managers,           s::ip4_list,       "xwindow-display-managers" },
	{ c::requested_ip,                 s::ip4,            "requested-ip-address" },
	{ c::lease_time,                   s::seconds,        "address-lease-time" },
	{ c::overload,                     s::u8,             "option-overload" },
	{ c::msg_type,                     s::msg_type,       "message-type" },
	{ c::server_id,                    s::ip4,            "server-identifier" },
	{ c::parameter_request_list,       s::code_list,      "parameters-list" },
	{ c::error_message,                s::text,           "error-message" },
	{ c::max_message_size,             s::u16,            "maximum-message-size" },
	{ c::renewal_time,                 s::seconds,        "renewal-time" },
	{ c::rebinding_time,               s::seconds,        "rebinding-time" },
	{ c::vendor_class_id,              s::opaque,         "vendor-class-identifier" },
	{ c::client_id,                    s::opaque,         "client-identifier" },
	{ c::netware_domain,               s::text,           "netware-domain" },
	{ c::netware_option,               s::opaque,         "netware-option" },
	{ c::nisplus_domain,               s::text,           "nisplus-domain" },
	{ c::nisplus_servers,              s::ip4_list,       "nisplus-servers" },
	{ c::tftp_server_name,             s::text,           "tftp-server-name" },
	{ c::bootfile_name,                s::text,           "bootfile-name" },
	// may legitimately be empty
	{ c::mobile_ip_home_agent,         s::opaque,         "mobileip-home-agents" },
	{ c::smtp_servers,                 s::ip4_list,       "smtp-servers" },
	{ c::pop3_servers,                 s::ip4_list,       "pop3-servers" },
	{ c::nntp_servers,                 s::ip4_list,       "nntp-servers" },
	{ c::www_servers,                  s::ip4_list,       "www-servers" },
	{ c::finger_servers,               s::ip4_list,       "finger-servers" },
	{ c::irc_servers,                  s::ip4_list,       "irc-servers" },
	{ c::streettalk_servers,           s::ip4_list,       "streettalk-servers" },
	{ c::stda_servers,                 s::ip4_list,       "streettalk-directory-assistance-servers" },
	{ c::user_class,                   s::opaque,         "user-class" },
	{ c::rapid_commit,                 s::none,           "rapid-commit" },
	{ c::client_fqdn,                  s::opaque,         "client-fqdn" },
	{ c::relay_agent_info,             s::opaque,         "relay-agent-information" },
	{ c::last_transaction_time,        s::seconds,        "client-last-transaction-time" },
	{ c::posix_timezone,               s::text,           "posix-timezone" },
	{ c::tzdb_timezone,                s::text,           "tzdb-timezone" },
	{ c::ipv6_only_preferred,          s::seconds,        "ipv6-only-preferred" },
	{ c::captive_portal,               s::text,           "captive-portal" },
	{ c::auto_config,                  s::u8,             "auto-configure" },
	{ c::subnet_selection,             s::ip4,            "subnet-selection" },
	{ c::domain_search,                s::opaque,         "domain-search" },
	{ c::classless_static_route,       s::opaque,         "classless-static-routes" },
	{ c::forcerenew_nonce_capable,     s::opaque,         "forcerenew-nonce-capable" },
	{ c::tftp_servers,                 s::ip4_list,       "tftp-servers" },
	// seconds since the epoch, RFC 6926
	{ c::base_time,                    s::u32,            "base-time" },
	{ c::start_time_of_state,          s::seconds,        "start-time-of-state" },
	{ c::ms_classless_static_route,    s::opaque,         "ms-classless-static-routes" },
	{ c::wpad,                         s::text,           "wpad" },
};

const array<const option_def*, 256>& option_index()
{
	static const auto index = [] {
		array<const option_def*, 256> ret;
		ret.fill(nullptr);
		for (const auto& def : option_defs) {
			ret[to_underlying(def.code)] = &def;
		}
		return ret;
	}();

	return index;
}

const char* shape_requirement(option_shape shape)
{
	switch (shape) {
		case s::none:
			return "0 bytes";
		case s::boolean:
			return "1 byte, 0 or 1";
		case s::u8:
		case s::msg_type:
			return "1 byte";
		case s::u16:
			return "2 bytes";
		case s::u32:
		case s::i32:
		case s::seconds:
		case s::ip4:
			return "4 bytes";
		case s::ip4_list:
			return "a non-zero multiple of 4 bytes";
		case s::ip4_pair_list:
			return "a non-zero multiple of 8 bytes";
		case s::u16_list:
			return "a non-zero multiple of 2 bytes";
		case s::text:
			return "at least 1 byte of UTF-8 text";
		case s::code_list:
		case s::opaque:
			break;
	}

	return "anything";
}

ip4_addr read_ip4(reader& r)
{
	return ip4_addr(r.read_u32());
}

template<class T, class F> vector<T> read_list(reader& r, F f)
{
	vector<T> ret;
	while (!r.empty()) {
		ret.push_back(f(r));
	}
	return ret;
}

// Returns nothing if `data` doesn't fit `shape`.
optional<option_value> parse_value(option_shape shape, gsl::span<const uint8_t> data)
{
	auto n = data.size();
	reader r(data);

	switch (shape) {
		case s::none:
			if (n == 0) {
				return option_value(monostate());
			}
			break;
		case s::boolean:
			if (n == 1 && data[0] <= 1) {
				return option_value(data[0] == 1);
			}
			break;
		case s::u8:
			if (n == 1) {
				return option_value(r.read_u8());
			}
			break;
		case s::msg_type:
			if (n == 1) {
				return option_value(static_cast<message_type>(r.read_u8()));
			}
			break;
		case s::u16:
			if (n == 2) {
				return option_value(r.read_u16());
			}
			break;
		case s::u32:
			if (n == 4) {
				return option_value(r.read_u32());
			}
			break;
		case s::i32:
			if (n == 4) {
				return option_value(static_cast<int32_t>(r.read_u32()));
			}
			break;
		case s::seconds:
			if (n == 4) {
				return option_value(seconds(r.read_u32()));
			}
			break;
		case s::ip4:
			if (n == 4) {
				return option_value(read_ip4(r));
			}
			break;
		case s::ip4_list:
			if (n && !(n % 4)) {
				return option_value(read_list<ip4_addr>(r, read_ip4));
			}
			break;
		case s::ip4_pair_list:
			if (n && !(n % 8)) {
				return option_value(read_list<ip4_pair>(r, [] (reader& rd) {
					auto first = read_ip4(rd);
					return ip4_pair(first, read_ip4(rd));
				}));
			}
			break;
		case s::u16_list:
			if (n && !(n % 2)) {
				return option_value(read_list<uint16_t>(r, [] (reader& rd) {
					return rd.read_u16();
				}));
			}
			break;
		case s::code_list: {
			vector<option_code> codes;
			transform(data.begin(), data.end(), back_inserter(codes), [] (uint8_t b) {
				return static_cast<option_code>(b);
			});
			return option_value(move(codes));
		}
		case s::text:
			if (n) {
				string str(data.begin(), data.end());
				if (is_valid_utf8(str)) {
					return option_value(move(str));
				}
			}
			break;
		case s::opaque:
			return option_value(opaque(data.begin(), data.end()));
	}

	return nullopt;
}

class value_encoder
{
	public:
	explicit value_encoder(buffer& b)
	: m_buf(b)
	{}

	void operator()(monostate)
	{}

	void operator()(bool v)
	{ pack<endian_big>(m_buf, uint8_t(v ? 1 : 0)); }

	void operator()(uint8_t v)
	{ pack<endian_big>(m_buf, v); }

	void operator()(uint16_t v)
	{ pack<endian_big>(m_buf, v); }

	void operator()(uint32_t v)
	{ pack<endian_big>(m_buf, v); }

	void operator()(int32_t v)
	{ pack<endian_big>(m_buf, uint32_t(v)); }

	void operator()(seconds v)
	{ pack<endian_big>(m_buf, v.count()); }

	void operator()(const ip4_addr& v)
	{ pack<endian_big>(m_buf, uint32_t(v.to_uint())); }

	void operator()(const ip4_pair& v)
	{
		operator()(v.first);
		operator()(v.second);
	}

	void operator()(message_type v)
	{ pack<endian_big>(m_buf, to_underlying(v)); }

	void operator()(option_code v)
	{ pack<endian_big>(m_buf, to_underlying(v)); }

	void operator()(const string& v)
	{ m_buf.append(v); }

	void operator()(const opaque& v)
	{ append(m_buf, v); }

	template<class T> void operator()(const vector<T>& v)
	{
		for (const auto& elem : v) {
			operator()(elem);
		}
	}

	private:
	buffer& m_buf;
};

class value_printer
{
	public:
	explicit value_printer(ostream& os)
	: m_os(os)
	{}

	void operator()(monostate)
	{ m_os << "(set)"; }

	void operator()(bool v)
	{ m_os << (v ? "true" : "false"); }

	void operator()(uint8_t v)
	{ m_os << int(v); }

	template<class T> void operator()(T v, enable_if_t<is_integral_v<T>>* = nullptr)
	{ m_os << v; }

	void operator()(seconds v)
	{ m_os << v.count() << "s"; }

	void operator()(const ip4_addr& v)
	{ m_os << v.to_string(); }

	void operator()(message_type v)
	{ m_os << v; }

	void operator()(const string& v)
	{ m_os << '"' << v << '"'; }

	void operator()(const opaque& v)
	{ m_os << "0x" << to_hex(gsl::span<const uint8_t>(v.data(), v.size())); }

	void operator()(const vector<ip4_addr>& v)
	{
		using boost::algorithm::join;
		using boost::adaptors::transformed;

		m_os << join(v | transformed([] (const ip4_addr& a) { return a.to_string(); }), ", ");
	}

	void operator()(const vector<ip4_pair>& v)
	{
		using boost::algorithm::join;
		using boost::adaptors::transformed;

		m_os << join(v | transformed([] (const ip4_pair& p) {
			return p.first.to_string() + "/" + p.second.to_string();
		}), ", ");
	}

	void operator()(const vector<uint16_t>& v)
	{
		using boost::algorithm::join;
		using boost::adaptors::transformed;

		m_os << join(v | transformed([] (uint16_t n) { return to_string(n); }), ", ");
	}

	void operator()(const vector<option_code>& v)
	{
		using boost::algorithm::join;
		using boost::adaptors::transformed;

		m_os << join(v | transformed(option_name), ", ");
	}

	private:
	ostream& m_os;
};
}

ostream& operator<<(ostream& os, option_code code)
{
	return os << option_name(code) << " (" << int(to_underlying(code)) << ")";
}

const option_def* find_option_def(option_code code)
{
	return option_index()[to_underlying(code)];
}

string option_name(option_code code)
{
	if (code == c::pad) {
		return "pad";
	} else if (code == c::end) {
		return "end";
	}

	auto def = find_option_def(code);
	return def ? def->name : "option-" + to_string(to_underlying(code));
}

ostream& operator<<(ostream& os, const option_value& value)
{
	visit(value_printer(os), value);
	return os;
}

option_value decode_option_value(option_code code, gsl::span<const uint8_t> data,
		const codec_config& cfg)
{
	auto def = find_option_def(code);
	if (!def) {
		return opaque(data.begin(), data.end());
	}

	auto ret = parse_value(def->shape, data);
	if (ret) {
		return move(*ret);
	} else if (cfg.strict_options) {
		throw content_error((boost::format("option %s (%d): expected %s, got %d bytes")
					% def->name % int(to_underlying(code))
					% shape_requirement(def->shape) % data.size()).str());
	}

	return opaque(data.begin(), data.end());
}

buffer encode_option_value(const option_value& value)
{
	buffer ret;
	visit(value_encoder(ret), value);
	return ret;
}

options::options(initializer_list<entry> entries)
{
	for (const auto& e : entries) {
		add(e.first, e.second);
	}
}

void options::check_code(option_code code)
{
	if (code == c::pad || code == c::end) {
		throw invalid_argument("cannot store " + option_name(code) + " option");
	}
}

options& options::add(option_code code, option_value value)
{
	check_code(code);
	m_opts.emplace_back(code, move(value));
	return *this;
}

options& options::set(option_code code, option_value value)
{
	check_code(code);

	auto match = [code] (const entry& e) { return e.first == code; };

	auto it = find_if(m_opts.begin(), m_opts.end(), match);
	if (it == m_opts.end()) {
		m_opts.emplace_back(code, move(value));
	} else {
		it->second = move(value);
		m_opts.erase(remove_if(it + 1, m_opts.end(), match), m_opts.end());
	}

	return *this;
}

const option_value* options::get(option_code code) const
{
	for (const auto& [key, v] : m_opts) {
		if (key == code) {
			return &v;
		}
	}

	return nullptr;
}

option_value* options::get(option_code code)
{
	return const_cast<option_value*>(as_const(*this).get(code));
}

vector<const option_value*> options::get_all(option_code code) const
{
	vector<const option_value*> ret;
	for (const auto& [key, v] : m_opts) {
		if (key == code) {
			ret.push_back(&v);
		}
	}

	return ret;
}

size_t options::remove(option_code code)
{
	auto size = m_opts.size();
	m_opts.erase(remove_if(m_opts.begin(), m_opts.end(), [code] (const entry& e) {
		return e.first == code;
	}), m_opts.end());
	return size - m_opts.size();
}

optional<message_type> options::msg_type() const
{
	auto t = get_as<message_type>(c::msg_type);
	if (t) {
		return *t;
	}

	return nullopt;
}

options options::decode(reader& r, const codec_config& cfg)
{
	options ret;

	while (!r.empty()) {
		auto code = static_cast<option_code>(r.read_u8());
		if (code == c::pad) {
			continue;
		} else if (code == c::end) {
			return ret;
		}

		if (r.empty()) {
			throw truncated_error("option " + option_name(code) + ": length", r.offset(), 1, 0);
		}

		auto len = r.read_u8();
		if (len > r.remaining()) {
			throw truncated_error("option " + option_name(code) + ": value",
					r.offset(), len, r.remaining());
		}

		ret.m_opts.emplace_back(code, decode_option_value(code, r.read_bytes(len), cfg));
	}

	if (cfg.require_end) {
		throw truncated_error("options: missing END option");
	}

	return ret;
}

void options::encode(buffer& b) const
{
	buffer ret;

	for (const auto& [code, value] : m_opts) {
		if (code == c::pad || code == c::end) {
			throw encode_error("cannot encode " + option_name(code) + " as an option");
		}

		auto data = encode_option_value(value);
		if (data.size() > 0xff) {
			throw encode_error("option " + option_name(code) + ": value of "
					+ to_string(data.size()) + "b exceeds 255b");
		}

		pack<endian_big>(ret, to_underlying(code));
		pack<endian_big>(ret, gsl::narrow_cast<uint8_t>(data.size()));
		ret += data;
	}

	pack<endian_big>(ret, to_underlying(c::end));
	b += ret;
}

ostream& operator<<(ostream& os, const options& opts)
{
	for (const auto& [code, value] : opts) {
		os << "  " << code << ": " << value << endl;
	}

	return os;
}
}
