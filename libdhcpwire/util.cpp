#include <boost/locale/encoding_utf.hpp>
#include "util.h"
using namespace std;

namespace dhcpwire {
int log::s_verbosity = log::normal;

bool is_valid_utf8(const string& str)
{
	using boost::locale::conv::utf_to_utf;
	using boost::locale::conv::conversion_error;

	try {
		utf_to_utf<char32_t>(str.data(), str.data() + str.size(), boost::locale::conv::stop);
		return true;
	} catch (const conversion_error&) {
		return false;
	}
}

void log::w(const string& msg)
{
	cerr << "warning: " << msg << endl;
}

void log::i(const string& msg)
{
	if (s_verbosity >= normal) {
		cerr << msg << endl;
	}
}

void log::d(const string& msg)
{
	if (s_verbosity >= debug) {
		cerr << msg << endl;
	}
}
}
