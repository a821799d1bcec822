#include <boost/algorithm/string.hpp>
#include <boost/range/adaptors.hpp>
#include <algorithm>
#include <cctype>
#include <vector>
#include "address.h"
#include "util.h"
using namespace std;

namespace dhcpwire {
namespace {
string byte_to_hex(uint8_t b)
{
	return (boost::format("%02x") % int(b)).str();
}
}

mac_addr::mac_addr(const string& addr)
{
	vector<string> octets;
	boost::split(octets, addr, boost::algorithm::is_any_of(":-"));

	auto is_octet = [] (const string& s) {
		return s.size() == 2 && isxdigit(uint8_t(s[0])) && isxdigit(uint8_t(s[1]));
	};

	if (octets.size() != length || !all_of(octets.begin(), octets.end(), is_octet)) {
		throw invalid_argument("invalid MAC address: " + addr);
	}

	transform(octets.begin(), octets.end(), m_addr.begin(), [] (const string& s) {
		return uint8_t(stoul(s, nullptr, 16));
	});
}

chaddr_type mac_addr::to_chaddr() const
{
	chaddr_type ret;
	ret.fill(0);
	copy(m_addr.begin(), m_addr.end(), ret.begin());
	return ret;
}

ostream& operator<<(ostream& os, const mac_addr& addr)
{
	using boost::algorithm::join;
	using boost::adaptors::transformed;

	os << join(addr.m_addr | transformed(byte_to_hex), ":");
	return os;
}

string chaddr_to_string(const chaddr_type& chaddr, uint8_t hlen)
{
	using boost::algorithm::join;
	using boost::adaptors::transformed;

	vector<uint8_t> used(chaddr.begin(), chaddr.begin() + min<size_t>(hlen, chaddr.size()));
	return join(used | transformed(byte_to_hex), ":");
}
}
