#ifndef ESCROW_CONFIG_HPP
#define ESCROW_CONFIG_HPP

#include"Escrow/Network.hpp"
#include"Escrow/RelativeTimelock.hpp"
#include"Escrow/log.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Escrow {

/** struct Escrow::Config
 *
 * @brief command-line settings.
 *
 * @desc Options take the form `--key=value`; anything not
 * starting with `--` is a positional argument.
 * `parse` throws Escrow::ConfigError on an unknown option
 * or a bad value.
 */
struct Config {
	Network network;
	/* Hex x-only key; empty to ask the server.  */
	std::string server_pubkey;
	/* Hex private key to sign and pay with; empty if none.  */
	std::string key;
	std::uint32_t unilateral_delay;
	double reject_grace;
	std::string db;
	std::string ark_url;
	LogLevel log_level;
	bool help;
	bool version;
	std::vector<std::string> arguments;

	Config();

	/* `args` excludes the program name.  */
	static Config parse(std::vector<std::string> const& args);

	RelativeTimelock delay() const {
		return RelativeTimelock::from_delay(unilateral_delay);
	}

	static std::string usage(std::string const& argv0);
};

}

#endif /* !defined(ESCROW_CONFIG_HPP) */
