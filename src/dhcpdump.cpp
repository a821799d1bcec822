#include <boost/format.hpp>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <cstdio>
#include <vector>
#include <pcap.h>
#include "message.h"
#include "util.h"
using namespace std;
using namespace dhcpwire;

namespace {
constexpr uint16_t ethertype_ip4 = 0x0800;
constexpr uint16_t ethertype_vlan = 0x8100;
constexpr uint8_t ipproto_udp = 17;
constexpr uint16_t port_bootps = 67;
constexpr uint16_t port_bootpc = 68;

struct dhcpdump_args
{
	codec_config cfg;
	const char* capture = nullptr;
	vector<string> files;
	bool quiet = false;
	bool verbose = false;
};

class pcap_error : public runtime_error
{
	public:
	pcap_error(const string& what, pcap_t* p)
	: runtime_error(what + ": " + pcap_geterr(p))
	{}
};

class pcap_file
{
	public:
	explicit pcap_file(const string& filename)
	{
		char errbuf[PCAP_ERRBUF_SIZE];
		m_pcap = pcap_open_offline(filename.c_str(), errbuf);
		if (!m_pcap) {
			throw runtime_error(filename + ": " + errbuf);
		}
	}

	~pcap_file()
	{
		pcap_close(m_pcap);
	}

	pcap_file(const pcap_file&) = delete;
	pcap_file& operator=(const pcap_file&) = delete;

	int datalink() const
	{ return pcap_datalink(m_pcap); }

	// returns false at the end of the capture
	bool next(gsl::span<const uint8_t>& pkt)
	{
		pcap_pkthdr* hdr;
		const u_char* data;

		int status = pcap_next_ex(m_pcap, &hdr, &data);
		if (status == PCAP_ERROR_BREAK) {
			return false;
		} else if (status == PCAP_ERROR) {
			throw pcap_error("pcap_next_ex", m_pcap);
		} else if (status != 1) {
			throw runtime_error("pcap_next_ex: error " + to_string(status));
		}

		pkt = gsl::span<const uint8_t>(data, hdr->caplen);
		return true;
	}

	private:
	pcap_t* m_pcap;
};

// Returns the UDP payload of a DHCP datagram, or an empty span if `pkt`
// isn't one.
gsl::span<const uint8_t> udp_dhcp_payload(gsl::span<const uint8_t> pkt, int datalink)
{
	size_t off = 0;

	if (datalink == DLT_EN10MB) {
		off = 12;
		auto proto = unpack<uint16_t, endian_big>(pkt, off);
		off += 2;
		if (proto == ethertype_vlan) {
			proto = unpack<uint16_t, endian_big>(pkt, off + 2);
			off += 4;
		}

		if (proto != ethertype_ip4) {
			return {};
		}
	} else if (datalink != DLT_RAW) {
		throw invalid_argument("unsupported link type " + to_string(datalink));
	}

	auto ip = pkt.subspan(off);
	auto ihl = (unpack<uint8_t, endian_big>(ip, 0) & 0x0f) * 4;
	auto frag = unpack<uint16_t, endian_big>(ip, 6);
	auto proto = unpack<uint8_t, endian_big>(ip, 9);

	// fragments other than the first can't be decoded on their own
	if (proto != ipproto_udp || (frag & 0x1fff) || ihl < 20) {
		return {};
	}

	if (size_t(ihl) > ip.size()) {
		throw truncated_error("ip header", off, ihl, ip.size());
	}

	auto udp = ip.subspan(ihl);
	auto sport = unpack<uint16_t, endian_big>(udp, 0);
	auto dport = unpack<uint16_t, endian_big>(udp, 2);
	auto len = unpack<uint16_t, endian_big>(udp, 4);

	if ((sport != port_bootps && sport != port_bootpc)
			|| (dport != port_bootps && dport != port_bootpc)) {
		return {};
	}

	if (len < 8 || len > udp.size()) {
		throw truncated_error("udp datagram", 0, len, udp.size());
	}

	return udp.subspan(8, len - 8);
}

bool dump(const string& what, gsl::span<const uint8_t> payload, const dhcpdump_args& args)
{
	try {
		auto msg = message::decode(payload, args.cfg);

		if (!args.quiet) {
			cout << what << ": " << msg;
		}

		if (args.verbose) {
			auto bytes = msg.to_bytes();
			bool stable = (message::decode(bytes, args.cfg) == msg);
			cout << "  encoded (" << bytes.size() << "b): " << to_hex(bytes) << endl;
			cout << "  round trip " << (stable ? "ok" : "MISMATCH") << endl;
		}

		if (!args.quiet) {
			cout << endl;
		}

		return true;
	} catch (const decode_error& e) {
		log::w(boost::format("%s: %s") % what % e.what());
	} catch (const encode_error& e) {
		log::w(boost::format("%s: re-encoding failed: %s") % what % e.what());
	}

	return false;
}

bool dump_capture(const dhcpdump_args& args)
{
	pcap_file pcap(args.capture);
	gsl::span<const uint8_t> pkt;
	unsigned n = 0, dhcp = 0, errors = 0;

	while (pcap.next(pkt)) {
		++n;

		gsl::span<const uint8_t> payload;
		try {
			payload = udp_dhcp_payload(pkt, pcap.datalink());
		} catch (const truncated_error& e) {
			log::d(boost::format("packet %d: %s") % n % e.what());
			continue;
		}

		if (payload.empty()) {
			continue;
		}

		++dhcp;
		if (!dump("packet " + to_string(n), payload, args)) {
			++errors;
		}
	}

	log::i(boost::format("%d packets, %d DHCP, %d undecodable") % n % dhcp % errors);
	return !errors;
}

buffer read_file(const string& filename)
{
	ifstream in;
	in.exceptions(ios::failbit | ios::badbit);
	in.open(filename.c_str(), ios::binary);

	ostringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

void usage(FILE* fp)
{
	fprintf(fp,
			"Usage: dhcpdump [OPTIONS...] FILE...\n"
			"       dhcpdump [OPTIONS...] -r CAPTURE\n"
			"\n"
			"Decodes DHCP messages stored as raw UDP payloads, or every\n"
			"DHCP datagram in a pcap capture.\n"
			"\n"
			"Options:\n"
			" -r <file>   Read packets from pcap capture\n"
			" -s          Reject options that don't match their layout\n"
			" -E          Reject messages without an END option\n"
			" -M          Don't check the magic cookie\n"
			" -q          Only report errors\n"
			" -v          Show re-encoded payload\n"
			" -h          Show this screen\n"
			"\n");
}
}

int main(int argc, char** argv)
{
	dhcpdump_args args;
	int c;

	while ((c = getopt(argc, argv, "r:sEMqvh")) != -1) {
		switch (c) {
			case 'r':
				args.capture = optarg;
				break;
			case 's':
				args.cfg.strict_options = true;
				break;
			case 'E':
				args.cfg.require_end = true;
				break;
			case 'M':
				args.cfg.check_magic = false;
				break;
			case 'q':
				args.quiet = true;
				log::verbosity(log::quiet);
				break;
			case 'v':
				args.verbose = true;
				log::verbosity(log::debug);
				break;
			case 'h':
				usage(stdout);
				return 0;
			default:
				usage(stderr);
				return 2;
		}
	}

	for (int i = optind; i < argc; ++i) {
		args.files.push_back(argv[i]);
	}

	if (args.capture ? !args.files.empty() : args.files.empty()) {
		usage(stderr);
		return 2;
	}

	try {
		bool ok = true;

		if (args.capture) {
			ok = dump_capture(args);
		} else {
			for (const auto& f : args.files) {
				auto data = read_file(f);
				ok &= dump(f, as_span(data), args);
			}
		}

		return ok ? 0 : 1;
	} catch (const exception& e) {
		log::w(e.what());
		return 2;
	}
}
