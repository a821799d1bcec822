#ifndef DHCPWIRE_CONFIG_H
#define DHCPWIRE_CONFIG_H

namespace dhcpwire {
struct codec_config
{
	// reject messages whose magic cookie isn't 63 82 53 63
	bool check_magic = true;
	// fail with truncated_error if the options end without an END option
	bool require_end = false;
	// fail with content_error if a known option doesn't match its shape,
	// instead of keeping its raw bytes as an opaque value
	bool strict_options = false;

	static codec_config strict()
	{
		codec_config ret;
		ret.require_end = true;
		ret.strict_options = true;
		return ret;
	}
};
}
#endif
