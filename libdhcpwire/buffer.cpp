#include <iomanip>
#include <sstream>
#include "buffer.h"
#include "util.h"
using namespace std;

namespace dhcpwire {
string to_hex(gsl::span<const uint8_t> b)
{
	ostringstream ostr;
	for (uint8_t c : b) {
		ostr << setw(2) << setfill('0') << hex << int(c);
	}

	return ostr.str();
}

buffer& write_padded_string(buffer& b, const optional<string>& str, size_t width)
{
	if (!str) {
		return b.append(width, '\0');
	}

	if (str->size() > width) {
		throw encode_error("string of " + to_string(str->size())
				+ "b exceeds field width of " + to_string(width) + "b");
	}

	b.append(*str);
	return b.append(width - str->size(), '\0');
}

gsl::span<const uint8_t> reader::read_bytes(size_t n)
{
	if (n > remaining()) {
		throw truncated_error("read", m_off, n, remaining());
	}

	auto ret = m_data.subspan(m_off, n);
	m_off += n;
	return ret;
}

optional<string> reader::read_padded_string(size_t width)
{
	auto off = m_off;
	auto field = read_bytes(width);

	auto end = find(field.begin(), field.end(), 0);
	if (end == field.begin()) {
		return nullopt;
	}

	string ret(field.begin(), end);
	if (!is_valid_utf8(ret)) {
		throw content_error("invalid text in " + to_string(width)
				+ "b string field at offset " + to_string(off));
	}

	return ret;
}
}
