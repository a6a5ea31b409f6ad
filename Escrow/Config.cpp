#include"Escrow/Config.hpp"
#include"Escrow/Error.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Util/Str.hpp"
#include<cstdlib>
#include<sstream>

namespace {

std::uint32_t parse_u32(std::string const& key, std::string const& v) {
	if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
		throw Escrow::ConfigError("--" + key + " expects a number, got " + v);
	auto n = std::strtoull(v.c_str(), nullptr, 10);
	if (n > 0xFFFFFFFFULL)
		throw Escrow::ConfigError("--" + key + " is too large: " + v);
	return std::uint32_t(n);
}

double parse_seconds(std::string const& key, std::string const& v) {
	auto is = std::istringstream(v);
	auto d = double();
	is >> d;
	if (!is || !is.eof() || d < 0)
		throw Escrow::ConfigError("--" + key + " expects seconds, got " + v);
	return d;
}

}

namespace Escrow {

Config::Config()
	: network(Mutinynet)
	, unilateral_delay(144)
	, reject_grace(3.0)
	, db("vescrow.sqlite3")
	, ark_url("https://mutinynet.arkade.sh")
	, log_level(Info)
	, help(false)
	, version(false)
	{ }

Config Config::parse(std::vector<std::string> const& args) {
	auto rv = Config();
	for (auto const& a : args) {
		if (a == "--help" || a == "-h") {
			rv.help = true;
			continue;
		}
		if (a == "--version" || a == "-V") {
			rv.version = true;
			continue;
		}
		if (a.size() < 2 || a.substr(0, 2) != "--") {
			rv.arguments.push_back(a);
			continue;
		}
		auto eq = a.find('=');
		if (eq == std::string::npos)
			throw ConfigError("option needs a value: " + a);
		auto key = a.substr(2, eq - 2);
		auto value = a.substr(eq + 1);

		if (key == "network") {
			if (!parse_network(value, rv.network))
				throw ConfigError("unknown network: " + value);
		} else if (key == "server-pubkey") {
			try {
				rv.server_pubkey = std::string(
					Secp256k1::XonlyPubKey(value)
				);
			} catch (std::invalid_argument const& e) {
				throw ConfigError( "bad --server-pubkey: "
						 + std::string(e.what())
						 );
			}
		} else if (key == "key") {
			try {
				rv.key = std::string(Secp256k1::PrivKey(value));
			} catch (Secp256k1::InvalidPrivKey const&) {
				/* Keep the secret out of the message.  */
				throw ConfigError("bad --key: not a private key");
			}
		} else if (key == "unilateral-delay") {
			rv.unilateral_delay = parse_u32(key, value);
			try {
				rv.delay().bip68_sequence();
			} catch (InvalidTimelock const& e) {
				throw ConfigError(e.what());
			}
		} else if (key == "reject-grace") {
			rv.reject_grace = parse_seconds(key, value);
		} else if (key == "db") {
			if (value.empty())
				throw ConfigError("--db needs a path");
			rv.db = value;
		} else if (key == "ark-url") {
			while (!value.empty() && value.back() == '/')
				value.pop_back();
			if (value.empty())
				throw ConfigError("--ark-url needs a URL");
			rv.ark_url = value;
		} else if (key == "log-level") {
			if (!parse_log_level(value, rv.log_level))
				throw ConfigError("unknown log level: " + value);
		} else
			throw ConfigError("unknown option: --" + key);
	}
	return rv;
}

std::string Config::usage(std::string const& argv0) {
	auto os = std::ostringstream();
	os << "Usage: " << argv0 << " [options] command [arguments]" << std::endl
	   << std::endl
	   << "Commands:" << std::endl
	   << " info                          Show the Ark server's key and delay." << std::endl
	   << " address BUYER SELLER ARBITER  Derive an escrow address and its" << std::endl
	   << "                               spending paths from x-only keys." << std::endl
	   << " list                          List stored contracts." << std::endl
	   << " state ADDRESS                 Show the funding state of a contract." << std::endl
	   << " wallet                        Show our wallet address and balance." << std::endl
	   << " open SELLER ARBITER TEXT      Open a contract with us as buyer." << std::endl
	   << " create ADDRESS ACTION         Fund, or propose release, refund" << std::endl
	   << "                               or \"direct settle\"." << std::endl
	   << " approve ADDRESS               Co-sign the pending transaction." << std::endl
	   << " reject ADDRESS                Reject the pending transaction." << std::endl
	   << " execute ADDRESS               Retry submitting an approved one." << std::endl
	   << std::endl
	   << "Options:" << std::endl
	   << " --network=NAME           mainnet, testnet, regtest or mutinynet." << std::endl
	   << " --server-pubkey=HEX      Server key; asked of the server if absent." << std::endl
	   << " --key=HEX                Our private key, for signing and paying." << std::endl
	   << " --unilateral-delay=N     Blocks below 512, else seconds." << std::endl
	   << " --reject-grace=SECONDS   How long rejections stay visible." << std::endl
	   << " --db=PATH                Contract database." << std::endl
	   << " --ark-url=URL            Ark server." << std::endl
	   << " --log-level=LEVEL        trace, debug, info, warn or error." << std::endl
	   << " --version, -V            Show version." << std::endl
	   << " --help, -h               Show this help." << std::endl
	   ;
	return os.str();
}

}
