#include <gtest/gtest.h>
#include <type_traits>
#include <utility>
#include "options.h"
#include "util.h"
using namespace std;
using namespace dhcpwire;
using boost::asio::ip::make_address_v4;

namespace {
options decode(const buffer& b, const codec_config& cfg = {})
{
	reader r(b);
	return options::decode(r, cfg);
}

template<class T> const T& only_value(const options& opts, option_code code)
{
	auto v = opts.get_as<T>(code);
	if (!v) {
		throw runtime_error("no " + option_name(code) + " value of expected type");
	}
	return *v;
}
}

TEST(options, stop_at_end)
{
	auto b = "\x35\x01\x01\xff\x03\x04\x01\x02\x03\x04"s;
	reader r(b);
	auto opts = options::decode(r);

	ASSERT_EQ(opts.size(), 1u);
	EXPECT_EQ(opts.msg_type(), message_type::discover);
	// bytes after END are not options
	EXPECT_EQ(r.offset(), 4u);
	EXPECT_FALSE(opts.contains(option_code::router));
}

TEST(options, pad_is_skipped)
{
	auto opts = decode("\x00\x00\x35\x01\x05\x00\xff"s);

	ASSERT_EQ(opts.size(), 1u);
	EXPECT_EQ(opts.begin()->first, option_code::msg_type);
	EXPECT_EQ(opts.msg_type(), message_type::ack);
}

TEST(options, missing_end)
{
	auto b = "\x35\x01\x03"s;

	auto opts = decode(b);
	EXPECT_EQ(opts.msg_type(), message_type::request);
	EXPECT_TRUE(decode(""s).empty());

	codec_config cfg;
	cfg.require_end = true;
	EXPECT_THROW(decode(b, cfg), truncated_error);
	EXPECT_THROW(decode(""s, cfg), truncated_error);
	EXPECT_NO_THROW(decode("\x35\x01\x03\xff"s, cfg));
}

TEST(options, truncated)
{
	// no length byte
	EXPECT_THROW(decode("\x35"s), truncated_error);
	// declared length runs past the input
	EXPECT_THROW(decode("\x36\x04\xc0\xa8"s), truncated_error);
	EXPECT_THROW(decode("\x0c\x06host\xff"s), truncated_error);
}

TEST(options, known_shapes)
{
	auto opts = decode(
			"\x01\x04\xff\xff\xff\x00"
			"\x02\x04\xff\xff\xff\xf0"
			"\x03\x08\xc0\xa8\x00\x01\xc0\xa8\x01\x01"
			"\x0c\x04host"
			"\x13\x01\x01"
			"\x16\x02\x05\xdc"
			"\x17\x01\x40"
			"\x19\x04\x01\x28\x05\xdc"
			"\x21\x08\x0a\x00\x00\x00\xc0\xa8\x00\x01"
			"\x33\x04\x00\x00\x0e\x10"
			"\x37\x03\x01\x03\x06"
			"\x50\x00"
			"\xff"s);

	EXPECT_EQ(only_value<ip4_addr>(opts, option_code::subnet_mask),
			make_address_v4("255.255.255.0"));
	EXPECT_EQ(only_value<int32_t>(opts, option_code::time_offset), -16);
	EXPECT_EQ(only_value<vector<ip4_addr>>(opts, option_code::router),
			(vector<ip4_addr> { make_address_v4("192.168.0.1"), make_address_v4("192.168.1.1") }));
	EXPECT_EQ(only_value<string>(opts, option_code::host_name), "host");
	EXPECT_EQ(only_value<bool>(opts, option_code::ip_forwarding), true);
	EXPECT_EQ(only_value<uint16_t>(opts, option_code::max_datagram_reassembly_size), 1500);
	EXPECT_EQ(only_value<uint8_t>(opts, option_code::default_ip_ttl), 64);
	EXPECT_EQ(only_value<vector<uint16_t>>(opts, option_code::path_mtu_plateau_table),
			(vector<uint16_t> { 296, 1500 }));

	auto& routes = only_value<vector<ip4_pair>>(opts, option_code::static_route);
	ASSERT_EQ(routes.size(), 1u);
	EXPECT_EQ(routes[0].first, make_address_v4("10.0.0.0"));
	EXPECT_EQ(routes[0].second, make_address_v4("192.168.0.1"));

	EXPECT_EQ(only_value<seconds>(opts, option_code::lease_time), seconds(3600));
	EXPECT_EQ(only_value<vector<option_code>>(opts, option_code::parameter_request_list),
			(vector<option_code> { option_code::subnet_mask, option_code::router,
			 option_code::domain_name_server }));

	ASSERT_TRUE(opts.contains(option_code::rapid_commit));
	EXPECT_TRUE(holds_alternative<monostate>(*opts.get(option_code::rapid_commit)));
}

TEST(options, unknown_code_is_opaque)
{
	auto opts = decode("\xe0\x03\x01\x02\x03\xff"s);

	auto v = opts.get_as<opaque>(static_cast<option_code>(224));
	ASSERT_NE(v, nullptr);
	EXPECT_EQ(*v, (opaque { 1, 2, 3 }));
	EXPECT_EQ(option_name(static_cast<option_code>(224)), "option-224");
}

TEST(options, shape_mismatch_degrades)
{
	// lease time with 3 bytes, empty DNS list, boolean 2, invalid UTF-8
	// hostname, empty hostname
	auto b = "\x33\x03\x00\x0e\x10"
			"\x06\x00"
			"\x13\x01\x02"
			"\x0c\x02\xc3\x28"
			"\x0f\x00"
			"\xff"s;

	auto opts = decode(b);
	ASSERT_EQ(opts.size(), 5u);
	EXPECT_EQ(only_value<opaque>(opts, option_code::lease_time), (opaque { 0x00, 0x0e, 0x10 }));
	EXPECT_EQ(only_value<opaque>(opts, option_code::domain_name_server), opaque());
	EXPECT_EQ(only_value<opaque>(opts, option_code::ip_forwarding), opaque { 2 });
	EXPECT_EQ(only_value<opaque>(opts, option_code::host_name), (opaque { 0xc3, 0x28 }));
	EXPECT_EQ(only_value<opaque>(opts, option_code::domain_name), opaque());

	// degraded values are written back as received
	buffer out;
	opts.encode(out);
	EXPECT_EQ(out, b);
}

TEST(options, shape_mismatch_strict)
{
	auto cfg = codec_config::strict();

	EXPECT_THROW(decode("\x33\x03\x00\x0e\x10\xff"s, cfg), content_error);
	EXPECT_THROW(decode("\x06\x00\xff"s, cfg), content_error);
	EXPECT_THROW(decode("\x13\x01\x02\xff"s, cfg), content_error);
	EXPECT_THROW(decode("\x0c\x02\xc3\x28\xff"s, cfg), content_error);
	// unknown codes and opaque options never mismatch
	EXPECT_NO_THROW(decode("\xe0\x00\x3d\x00\xff"s, cfg));
}

TEST(options, duplicates_in_order)
{
	auto opts = decode("\x06\x04\x01\x01\x01\x01\x0c\x01x\x06\x04\x02\x02\x02\x02\xff"s);

	auto all = opts.get_all(option_code::domain_name_server);
	ASSERT_EQ(all.size(), 2u);
	EXPECT_EQ(get<vector<ip4_addr>>(*all[0]), vector<ip4_addr> { make_address_v4("1.1.1.1") });
	EXPECT_EQ(get<vector<ip4_addr>>(*all[1]), vector<ip4_addr> { make_address_v4("2.2.2.2") });
	EXPECT_EQ(opts.get(option_code::domain_name_server), all[0]);

	buffer out;
	opts.encode(out);
	EXPECT_EQ(out, "\x06\x04\x01\x01\x01\x01\x0c\x01x\x06\x04\x02\x02\x02\x02\xff"s);
}

TEST(options, encode)
{
	options opts;
	opts.add(option_code::msg_type, message_type::offer);
	opts.add(option_code::server_id, make_address_v4("192.168.0.1"));

	buffer b;
	opts.encode(b);
	EXPECT_EQ(b, "\x35\x01\x02\x36\x04\xc0\xa8\x00\x01\xff"s);

	b.clear();
	options().encode(b);
	EXPECT_EQ(b, "\xff"s);
}

TEST(options, encode_too_long)
{
	options opts;
	opts.add(option_code::host_name, string(255, 'a'));

	buffer b;
	EXPECT_NO_THROW(opts.encode(b));
	EXPECT_EQ(b.size(), 2u + 255 + 1);

	auto before = b;
	opts.set(option_code::host_name, string(256, 'a'));
	EXPECT_THROW(opts.encode(b), encode_error);
	EXPECT_EQ(b, before);

	opts.set(option_code::host_name, vector<ip4_addr>(64, ip4_addr()));
	EXPECT_THROW(opts.encode(b), encode_error);
	EXPECT_EQ(b, before);
}

TEST(options, failed_encode_leaves_buffer_unchanged)
{
	options opts;
	opts.add(option_code::msg_type, message_type::request);
	opts.add(option_code::domain_name, string("lan"));
	opts.add(option_code::host_name, string(300, 'h'));

	buffer b = "prefix";
	EXPECT_THROW(opts.encode(b), encode_error);
	EXPECT_EQ(b, "prefix");
}

TEST(options, codes_are_read_only)
{
	static_assert(is_same_v<decltype(*declval<options&>().begin()), const options::entry&>);

	options opts;
	opts.add(option_code::host_name, string("a"));
	opts.add(option_code::domain_name, string("lan"));

	// values can still be changed in place
	*opts.get(option_code::host_name) = string("b");

	buffer b;
	opts.encode(b);
	EXPECT_EQ(b, "\x0c\x01" "b" "\x0f\x03" "lan" "\xff"s);

	auto back = decode(b);
	ASSERT_EQ(back.size(), 2u);
	EXPECT_EQ(back, opts);
}

TEST(options, plain_u32)
{
	auto b = "\x98\x04\x5f\x5e\x10\x00\x99\x04\x00\x00\x00\x3c\xff"s;
	auto opts = decode(b);

	EXPECT_EQ(only_value<uint32_t>(opts, option_code::base_time), 0x5f5e1000u);
	EXPECT_EQ(only_value<seconds>(opts, option_code::start_time_of_state), seconds(60));
	EXPECT_EQ(find_option_def(option_code::base_time)->shape, option_shape::u32);

	buffer out;
	opts.encode(out);
	EXPECT_EQ(out, b);

	// anything but 4 bytes is a mismatch
	EXPECT_THROW(decode("\x98\x02\x00\x01\xff"s, codec_config::strict()), content_error);
}

TEST(options, pad_and_end_are_not_stored)
{
	options opts;
	EXPECT_THROW(opts.add(option_code::pad, monostate()), invalid_argument);
	EXPECT_THROW(opts.add(option_code::end, monostate()), invalid_argument);
	EXPECT_THROW(opts.set(option_code::end, monostate()), invalid_argument);
	EXPECT_TRUE(opts.empty());
}

TEST(options, set_get_remove)
{
	options opts;
	opts.add(option_code::router, make_address_v4("10.0.0.1"));
	opts.add(option_code::host_name, string("a"));
	opts.add(option_code::router, make_address_v4("10.0.0.2"));

	opts.set(option_code::router, make_address_v4("10.0.0.3"));
	ASSERT_EQ(opts.size(), 2u);
	EXPECT_EQ(opts.begin()->first, option_code::router);
	EXPECT_EQ(*opts.get_as<ip4_addr>(option_code::router), make_address_v4("10.0.0.3"));

	opts.set(option_code::lease_time, seconds(60));
	EXPECT_EQ(opts.size(), 3u);
	EXPECT_EQ(*opts.get_as<seconds>(option_code::lease_time), seconds(60));
	EXPECT_EQ(opts.get_as<uint32_t>(option_code::lease_time), nullptr);

	*opts.get(option_code::host_name) = string("b");
	EXPECT_EQ(*opts.get_as<string>(option_code::host_name), "b");

	opts.add(option_code::lease_time, seconds(120));
	EXPECT_EQ(opts.remove(option_code::lease_time), 2u);
	EXPECT_EQ(opts.remove(option_code::lease_time), 0u);
	EXPECT_FALSE(opts.contains(option_code::lease_time));
	EXPECT_EQ(opts.get(option_code::lease_time), nullptr);
	EXPECT_EQ(opts.msg_type(), nullopt);
}

TEST(options, initializer_list)
{
	options a {
		{ option_code::msg_type, message_type::discover },
		{ option_code::requested_ip, make_address_v4("192.168.0.3") },
	};

	options b;
	b.add(option_code::msg_type, message_type::discover);
	EXPECT_NE(a, b);

	b.add(option_code::requested_ip, make_address_v4("192.168.0.3"));
	EXPECT_EQ(a, b);
}

TEST(option_value, encode)
{
	EXPECT_EQ(encode_option_value(monostate()), "");
	EXPECT_EQ(encode_option_value(true), "\x01"s);
	EXPECT_EQ(encode_option_value(uint16_t(576)), "\x02\x40"s);
	EXPECT_EQ(encode_option_value(int32_t(-1)), "\xff\xff\xff\xff"s);
	EXPECT_EQ(encode_option_value(seconds(86400)), "\x00\x01\x51\x80"s);
	EXPECT_EQ(encode_option_value(string("example.org")), "example.org");
	EXPECT_EQ(encode_option_value(vector<option_code> { option_code::router, option_code::wpad }),
			"\x03\xfc"s);
	EXPECT_EQ(encode_option_value(vector<ip4_pair> {
				{ make_address_v4("10.0.0.0"), make_address_v4("255.0.0.0") } }),
			"\x0a\x00\x00\x00\xff\x00\x00\x00"s);
}

TEST(option_value, decode_is_shape_driven)
{
	auto data = "\x00\x00\x0e\x10"s;

	EXPECT_EQ(decode_option_value(option_code::lease_time, as_span(data)),
			option_value(seconds(3600)));
	EXPECT_EQ(decode_option_value(option_code::server_id, as_span(data)),
			option_value(make_address_v4("0.0.14.16")));
	EXPECT_EQ(decode_option_value(option_code::client_id, as_span(data)),
			option_value(opaque { 0x00, 0x00, 0x0e, 0x10 }));
}

TEST(option_registry, lookup)
{
	auto def = find_option_def(option_code::lease_time);
	ASSERT_NE(def, nullptr);
	EXPECT_EQ(def->shape, option_shape::seconds);
	EXPECT_STREQ(def->name, "address-lease-time");

	EXPECT_EQ(find_option_def(option_code::msg_type)->shape, option_shape::msg_type);
	EXPECT_EQ(find_option_def(option_code::router)->shape, option_shape::ip4_list);
	EXPECT_EQ(find_option_def(option_code::host_name)->shape, option_shape::text);
	EXPECT_EQ(find_option_def(option_code::pad), nullptr);
	EXPECT_EQ(find_option_def(option_code::end), nullptr);
	EXPECT_EQ(find_option_def(static_cast<option_code>(224)), nullptr);

	EXPECT_EQ(option_name(option_code::pad), "pad");
	EXPECT_EQ(option_name(option_code::end), "end");
	EXPECT_EQ(option_name(option_code::server_id), "server-identifier");
}

TEST(options, print)
{
	options opts;
	opts.add(option_code::msg_type, message_type::offer);
	opts.add(option_code::lease_time, seconds(60));
	opts.add(option_code::domain_name_server, vector<ip4_addr> {
			make_address_v4("8.8.8.8"), make_address_v4("8.8.4.4") });
	opts.add(option_code::client_id, opaque { 0x01, 0xab });

	EXPECT_EQ(stringify(opts),
			"  message-type (53): DHCPOFFER\n"
			"  address-lease-time (51): 60s\n"
			"  domain-name-servers (6): 8.8.8.8, 8.8.4.4\n"
			"  client-identifier (61): 0x01ab\n");
}
