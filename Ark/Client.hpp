#ifndef ARK_CLIENT_HPP
#define ARK_CLIENT_HPP

#include"Escrow/ChainQueryIF.hpp"
#include"Escrow/ChainSubmitIF.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }

namespace Ark {

/* What `GET /v1/info` tells us of the server.  */
struct ServerInfo {
	Secp256k1::XonlyPubKey signer;
	/* Blocks if under 512, otherwise seconds.  */
	std::uint32_t unilateral_exit_delay;
	std::string network;
};

/** class Ark::Client
 *
 * @brief talks to an Ark server over its REST API.
 *
 * @desc Requests block, so they run on the given thread
 * pool.
 * Every failure, including HTTP error statuses and
 * unparseable replies, is an Escrow::NetworkError.
 */
class Client : public Escrow::ChainQueryIF
	     , public Escrow::ChainSubmitIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Client() =delete;
	Client(Client const&) =delete;

	Client( Ev::ThreadPool& threadpool
	      /* Base URL of the server, without a trailing slash.  */
	      , std::string base_url
	      );
	~Client();

	Ev::Io<ServerInfo> get_info();

	Ev::Io<std::vector<Escrow::Vtxo>>
	get_unspent_outputs(std::vector<std::uint8_t> pk_script) override;

	Ev::Io<std::string>
	submit( Bitcoin::Psbt spend
	      , std::vector<Bitcoin::Psbt> checkpoints
	      ) override;
	Ev::Io<void>
	finalize( std::string reference
		, std::vector<Bitcoin::Psbt> checkpoints
		) override;
};

/* Standard base64 with padding.  */
std::string base64(std::vector<std::uint8_t> const&);

}

#endif /* !defined(ARK_CLIENT_HPP) */
