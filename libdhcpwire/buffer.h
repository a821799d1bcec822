#ifndef DHCPWIRE_BUFFER_H
#define DHCPWIRE_BUFFER_H
#include <boost/endian.hpp>
#include <gsl/gsl>
#include <algorithm>
#include <optional>
#include <cstring>
#include <cstdint>
#include <string>
#include <array>
#include "errors.h"

namespace dhcpwire {
typedef std::string buffer;

constexpr auto endian_native = boost::endian::order::native;
constexpr auto endian_big = boost::endian::order::big;
constexpr auto endian_little = boost::endian::order::little;

inline gsl::span<const uint8_t> as_span(const buffer& b)
{
	return { reinterpret_cast<const uint8_t*>(b.data()), b.size() };
}

std::string to_hex(gsl::span<const uint8_t> b);

inline std::string to_hex(const buffer& b)
{
	return to_hex(as_span(b));
}

namespace detail {
template<boost::endian::order O, class T> T conditional_reverse(T value)
{
	return boost::endian::conditional_reverse<endian_native, O>(value);
}
}

template<class T, boost::endian::order O> T unpack(gsl::span<const uint8_t> b, size_t off = 0)
{
	static_assert(std::is_integral_v<T>);
	if (off > b.size() || sizeof(T) > (b.size() - off)) {
		throw truncated_error("unpack", off, sizeof(T), b.size() - std::min(off, b.size()));
	}

	T val;
	memcpy(&val, b.data() + off, sizeof(T));
	return detail::conditional_reverse<O>(val);
}

template<boost::endian::order O, class T> buffer& pack(buffer& b, T val)
{
	val = detail::conditional_reverse<O>(val);
	return b.append(reinterpret_cast<const char*>(&val), sizeof(T));
}

inline buffer& append(buffer& b, gsl::span<const uint8_t> data)
{
	return b.append(reinterpret_cast<const char*>(data.data()), data.size());
}

// Writes `str` followed by NUL bytes up to `width`. An absent string is
// written as `width` NUL bytes.
buffer& write_padded_string(buffer& b, const std::optional<std::string>& str, size_t width);

// Sequential, bounds-checked reader. Multi-byte integers are big endian.
class reader
{
	public:
	explicit reader(gsl::span<const uint8_t> data)
	: m_data(data), m_off(0)
	{}

	explicit reader(const buffer& b)
	: reader(as_span(b))
	{}

	template<class T> T read()
	{
		auto b = read_bytes(sizeof(T));
		return unpack<T, endian_big>(b);
	}

	uint8_t read_u8()
	{ return read<uint8_t>(); }

	uint16_t read_u16()
	{ return read<uint16_t>(); }

	uint32_t read_u32()
	{ return read<uint32_t>(); }

	template<size_t N> std::array<uint8_t, N> read_array()
	{
		auto b = read_bytes(N);
		std::array<uint8_t, N> ret;
		std::copy(b.begin(), b.end(), ret.begin());
		return ret;
	}

	gsl::span<const uint8_t> read_bytes(size_t n);

	// Reads a NUL padded string field of exactly `width` bytes. Returns
	// nothing if the field starts with a NUL byte. Throws content_error
	// if the text is not valid UTF-8.
	std::optional<std::string> read_padded_string(size_t width);

	size_t remaining() const
	{ return m_data.size() - m_off; }

	bool empty() const
	{ return !remaining(); }

	size_t offset() const
	{ return m_off; }

	private:
	gsl::span<const uint8_t> m_data;
	size_t m_off;
};
}
#endif
