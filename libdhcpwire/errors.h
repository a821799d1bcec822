#ifndef DHCPWIRE_ERRORS_H
#define DHCPWIRE_ERRORS_H
#include <stdexcept>
#include <string>

namespace dhcpwire {
class decode_error : public std::runtime_error
{
	public:
	using std::runtime_error::runtime_error;
};

// fewer bytes left than a field or declared option length needs
class truncated_error : public decode_error
{
	public:
	truncated_error(const std::string& what, size_t offset, size_t needed, size_t available)
	: decode_error(what + ": need " + std::to_string(needed) + "b at offset "
			+ std::to_string(offset) + ", have " + std::to_string(available) + "b"),
	  m_offset(offset)
	{}

	explicit truncated_error(const std::string& what)
	: decode_error(what), m_offset(0)
	{}

	size_t offset() const noexcept
	{ return m_offset; }

	private:
	size_t m_offset;
};

class structure_error : public decode_error
{
	public:
	using decode_error::decode_error;
};

class not_dhcp_error : public structure_error
{
	public:
	using structure_error::structure_error;
};

class content_error : public decode_error
{
	public:
	using decode_error::decode_error;
};

class encode_error : public std::invalid_argument
{
	public:
	using std::invalid_argument::invalid_argument;
};
}
#endif
