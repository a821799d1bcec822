#ifndef DHCPWIRE_UTIL_H
#define DHCPWIRE_UTIL_H
#include <boost/lexical_cast.hpp>
#include <boost/format.hpp>
#include <type_traits>
#include <iostream>
#include <cstdint>
#include <string>

namespace dhcpwire {
template<typename T> std::string stringify(const T& t)
{
	return boost::lexical_cast<std::string>(t);
}

template<typename E> constexpr auto to_underlying(E e) noexcept
{
	return static_cast<std::underlying_type_t<E>>(e);
}

bool is_valid_utf8(const std::string& str);

class log
{
	public:
	enum level
	{
		quiet = -1,
		normal = 0,
		verbose = 1,
		debug = 2
	};

	static void w(const std::string& msg);
	static void i(const std::string& msg);
	static void d(const std::string& msg);

	static void w(const boost::format& fmt)
	{ w(fmt.str()); }

	static void i(const boost::format& fmt)
	{ i(fmt.str()); }

	static void d(const boost::format& fmt)
	{ d(fmt.str()); }

	static void verbosity(int v)
	{ s_verbosity = v; }

	static int verbosity()
	{ return s_verbosity; }

	private:
	static int s_verbosity;
};
}
#endif
