#include <gtest/gtest.h>
#include "fields.h"
#include "errors.h"
#include "util.h"
using namespace std;
using namespace dhcpwire;

TEST(opcode, only_request_and_reply_are_valid)
{
	EXPECT_EQ(opcode_from_u8(1), opcode::boot_request);
	EXPECT_EQ(opcode_from_u8(2), opcode::boot_reply);

	EXPECT_THROW(opcode_from_u8(0), structure_error);
	EXPECT_THROW(opcode_from_u8(3), structure_error);
	EXPECT_THROW(opcode_from_u8(0xff), structure_error);

	EXPECT_EQ(stringify(opcode::boot_request), "BOOTREQUEST");
	EXPECT_EQ(stringify(opcode::boot_reply), "BOOTREPLY");
}

TEST(htype, known_and_unknown)
{
	auto eth = htype::from_u8(1);
	EXPECT_TRUE(eth.is_known());
	EXPECT_EQ(eth.known(), htype::eth);
	EXPECT_EQ(eth, htype(htype::eth));
	EXPECT_EQ(eth.name(), "Ethernet");

	auto ib = htype::from_u8(32);
	EXPECT_EQ(ib.known(), htype::infiniband);

	auto odd = htype::from_u8(200);
	EXPECT_FALSE(odd.is_known());
	EXPECT_EQ(odd.known(), nullopt);
	EXPECT_EQ(odd.to_u8(), 200);
	EXPECT_EQ(odd.name(), "unknown (200)");
	EXPECT_NE(odd, eth);

	EXPECT_FALSE(htype::from_u8(0).is_known());
	EXPECT_FALSE(htype::from_u8(33).is_known());
}

TEST(htype, only_named_values_are_known)
{
	htype odd(static_cast<htype::kind>(200));
	EXPECT_FALSE(odd.is_known());
	EXPECT_EQ(odd, htype::from_u8(200));
	EXPECT_EQ(odd.name(), "unknown (200)");

	htype eth(static_cast<htype::kind>(1));
	EXPECT_TRUE(eth.is_known());
	EXPECT_EQ(eth.known(), htype::eth);

	for (unsigned i = 0; i < 256; ++i) {
		auto h = htype::from_u8(i);
		EXPECT_EQ(h.is_known(), h.name().find("unknown") == string::npos) << i;
	}
}

TEST(htype, every_value_is_kept)
{
	for (unsigned i = 0; i < 256; ++i) {
		EXPECT_EQ(htype::from_u8(i).to_u8(), i);
	}
}

TEST(htype, default_is_ethernet)
{
	EXPECT_EQ(htype().to_u8(), 1);
	EXPECT_EQ(stringify(htype()), "Ethernet");
}

TEST(flags, every_value_is_kept)
{
	for (unsigned i = 0; i <= 0xffff; ++i) {
		flags f(i);
		ASSERT_EQ(f.raw(), i);
		ASSERT_EQ(f.broadcast(), bool(i & 0x8000));
		ASSERT_EQ(f.reserved(), i & 0x7fff);
	}
}

TEST(flags, broadcast_keeps_reserved_bits)
{
	flags f(0x0003);
	EXPECT_FALSE(f.broadcast());

	f.broadcast(true);
	EXPECT_EQ(f.raw(), 0x8003);
	EXPECT_TRUE(f.broadcast());

	f.broadcast(true);
	EXPECT_EQ(f.raw(), 0x8003);

	flags g(0xffff);
	g.broadcast(false);
	EXPECT_EQ(g.raw(), 0x7fff);
	EXPECT_EQ(g.reserved(), 0x7fff);
}

TEST(flags, print)
{
	EXPECT_EQ(stringify(flags(0x8000)), "0x8000 (broadcast)");
	EXPECT_EQ(stringify(flags(0x0001)), "0x0001");
}

TEST(message_type, names)
{
	EXPECT_EQ(message_type_name(message_type::discover), "DHCPDISCOVER");
	EXPECT_EQ(message_type_name(message_type::offer), "DHCPOFFER");
	EXPECT_EQ(message_type_name(message_type::ack), "DHCPACK");
	EXPECT_EQ(message_type_name(message_type::tls), "DHCPTLS");
	EXPECT_EQ(message_type_name(static_cast<message_type>(0)), "unknown (0)");
	EXPECT_EQ(message_type_name(static_cast<message_type>(42)), "unknown (42)");
	EXPECT_EQ(stringify(message_type::nak), "DHCPNAK");
}
