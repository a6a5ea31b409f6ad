#include"Ark/Client.hpp"
#include"Escrow/Config.hpp"
#include"Escrow/ContractCodec.hpp"
#include"Escrow/ContractRegistry.hpp"
#include"Escrow/Coordinator.hpp"
#include"Escrow/Directory.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/EscrowState.hpp"
#include"Escrow/KeySigner.hpp"
#include"Escrow/LogSink.hpp"
#include"Escrow/Main.hpp"
#include"Escrow/Msg/Shutdown.hpp"
#include"Escrow/Relay.hpp"
#include"Escrow/RelayTransport.hpp"
#include"Escrow/Script.hpp"
#include"Escrow/Waiter.hpp"
#include"Escrow/Wallet.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Sqlite3.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

#ifndef PACKAGE_VERSION
# define PACKAGE_VERSION "0"
#endif

namespace Escrow {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;

	std::string argv0;
	std::vector<std::string> args;
	Config config;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<LogSink> sink;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Ark::Client> client;
	std::unique_ptr<Relay> relay;
	std::unique_ptr<RelayTransport> transport;
	std::unique_ptr<ContractRegistry> registry;
	std::unique_ptr<Waiter> waiter;
	std::unique_ptr<Directory> directory;
	std::unique_ptr<KeySigner> signer;
	std::unique_ptr<Wallet> wallet;
	std::unique_ptr<Coordinator> coordinator;
	std::shared_ptr<Ark::ServerInfo> server_info;

	int exit_code;

	/* The configured server key and delay, or the server's.  */
	Ev::Io<std::shared_ptr<Ark::ServerInfo>> server() {
		if (!config.server_pubkey.empty()) {
			auto info = std::make_shared<Ark::ServerInfo>(Ark::ServerInfo{
				Secp256k1::XonlyPubKey(config.server_pubkey),
				config.unilateral_delay,
				to_string(config.network)
			});
			return Ev::lift(info);
		}
		return client->get_info().then([](Ark::ServerInfo info) {
			return Ev::lift(std::make_shared<Ark::ServerInfo>(
				std::move(info)
			));
		});
	}

	Ev::Io<void> start_registry() {
		relay = Util::make_unique<Relay>();
		transport = Util::make_unique<RelayTransport>(*relay);
		registry = Util::make_unique<ContractRegistry>(
			*bus, *transport, Sqlite3::Db(config.db)
		);
		return registry->start();
	}

	KeySigner& need_signer(std::string const& cmd) {
		if (config.key.empty())
			throw ConfigError(cmd + " needs --key");
		if (!signer)
			signer = Util::make_unique<KeySigner>(
				Secp256k1::PrivKey(config.key)
			);
		return *signer;
	}

	static Secp256k1::XonlyPubKey
	parse_pubkey(std::string const& what, std::string const& hex) {
		try {
			return Secp256k1::XonlyPubKey(hex);
		} catch (Secp256k1::InvalidPubKey const&) {
			throw ConfigError("bad " + what + " key: " + hex);
		}
	}

	/* Builds every module on the bus, then starts them.
	 * The wallet pays deposits, so the key must be known.
	 */
	Ev::Io<void> start_modules(std::string const& cmd) {
		auto& owner = need_signer(cmd);
		return start_registry().then([this]() {
			return server();
		}).then([this, &owner](std::shared_ptr<Ark::ServerInfo> i) {
			server_info = std::move(i);
			auto delay = RelativeTimelock::from_delay(
				server_info->unilateral_exit_delay
			);
			waiter = Util::make_unique<Waiter>(*bus);
			directory = Util::make_unique<Directory>(*bus, *transport);
			wallet = Util::make_unique<Wallet>(
				*bus, owner, *client, *client,
				server_info->signer, delay, config.network
			);
			coordinator = Util::make_unique<Coordinator>(
				*bus, *registry, *transport, *client, *client,
				*wallet, *waiter,
				CoordinatorSettings{ server_info->signer, delay
						   , config.network
						   , config.reject_grace
						   }
			);
			return directory->start();
		});
	}

	std::string party_address(Secp256k1::XonlyPubKey const& pubkey) const {
		return Wallet::address_of( pubkey
					 , server_info->signer
					 , RelativeTimelock::from_delay(
						server_info->unilateral_exit_delay
					   )
					 , config.network
					 ).encode();
	}

	Ev::Io<Party> enroll(Secp256k1::XonlyPubKey const& pubkey) {
		return directory->enroll(pubkey, party_address(pubkey));
	}

	void print_pending(std::string const& address) {
		auto c = registry->find(address);
		if (c.pending)
			cout << ContractCodec::encode(*c.pending).output()
			     << std::endl;
		else
			cout << ContractCodec::encode(c).output() << std::endl;
	}

	Ev::Io<void> cmd_info() {
		return client->get_info().then([this](Ark::ServerInfo info) {
			auto js = Json::Out()
				.start_object()
					.field("signerPubkey", std::string(info.signer))
					.field("unilateralExitDelay", info.unilateral_exit_delay)
					.field("network", info.network)
				.end_object()
				;
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_address() {
		if (args.size() != 4)
			throw ConfigError("address needs BUYER SELLER ARBITER");
		auto keys = std::make_shared<std::vector<std::vector<std::uint8_t>>>();
		for (auto i = std::size_t(1); i < 4; ++i) {
			if (!Util::Str::ishex(args[i]))
				throw ConfigError("not a hex key: " + args[i]);
			keys->push_back(Util::Str::hexread(args[i]));
		}
		return server().then([this, keys](std::shared_ptr<Ark::ServerInfo> info) {
			auto opts = EscrowOptions{
				(*keys)[0], (*keys)[1], (*keys)[2],
				info->signer.to_bytes(),
				RelativeTimelock::from_delay(info->unilateral_exit_delay)
			};
			auto script = Script(opts);

			auto out = Json::Out();
			auto obj = out.start_object();
			obj.field("address", script.address(config.network).encode());
			obj.field("pkScript", Util::Str::hexdump(script.pk_script()));
			auto arr = obj.start_array("spendingPaths");
			for (auto const& p : script.spending_paths()) {
				auto signers = Json::Out();
				auto sarr = signers.start_array();
				for (auto r : p.signers)
					sarr.entry(to_string(r));
				sarr.end_array();
				arr.start_object()
					.field("name", p.name)
					.field("type", std::string(
						p.collaborative ? "collaborative"
								: "unilateral"
					))
					.field("description", p.description)
					.field("script", p.script_hex)
					.field("signers", signers)
				.end_object();
			}
			arr.end_array();
			obj.end_object();
			cout << out.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_list() {
		return start_registry().then([this]() {
			auto js = ContractCodec::encode(registry->contracts());
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_state() {
		if (args.size() != 2)
			throw ConfigError("state needs ADDRESS");
		auto address = args[1];
		return start_registry().then([this]() {
			return server();
		}).then([this, address](std::shared_ptr<Ark::ServerInfo> info) {
			auto c = registry->find(address);
			auto delay = RelativeTimelock::from_delay(
				info->unilateral_exit_delay
			);
			auto script = Script(c.options(info->signer, delay));
			return client->get_unspent_outputs(script.pk_script());
		}).then([this](std::vector<Vtxo> vtxos) {
			auto s = EscrowState::from_vtxos(vtxos);
			auto js = Json::Out()
				.start_object()
					.field("status", to_string(s.status))
					.field("balance", s.balance)
					.field("vtxoExists", s.vtxo_exists)
				.end_object()
				;
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_wallet() {
		return start_modules("wallet").then([this]() {
			return wallet->balance();
		}).then([this](std::uint64_t balance) {
			auto js = Json::Out()
				.start_object()
					.field("address", wallet->address().encode())
					.field("balance", balance)
				.end_object()
				;
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	/* We are the buyer; the others are named by key.  */
	Ev::Io<void> cmd_open() {
		if (args.size() != 4)
			throw ConfigError("open needs SELLER ARBITER TEXT");
		auto seller = parse_pubkey("seller", args[1]);
		auto arbiter = parse_pubkey("arbiter", args[2]);
		auto description = args[3];
		auto parties = std::make_shared<std::vector<Party>>();
		auto keep = [parties](Party p) {
			parties->push_back(std::move(p));
			return Ev::lift();
		};
		return start_modules("open").then([this]() {
			return enroll(signer->pubkey());
		}).then(keep).then([this, seller]() {
			return enroll(seller);
		}).then(keep).then([this, arbiter]() {
			return enroll(arbiter);
		}).then(keep).then([this, parties, description]() {
			return coordinator->open_contract( (*parties)[0]
							 , (*parties)[1]
							 , (*parties)[2]
							 , description
							 );
		}).then([this](Contract c) {
			cout << ContractCodec::encode(c).output() << std::endl;
			return Ev::lift();
		});
	}

	/* "direct settle" may come as one argument or two.  */
	Ev::Io<void> cmd_create() {
		if (args.size() < 3)
			throw ConfigError("create needs ADDRESS ACTION");
		auto name = args[2];
		for (auto i = std::size_t(3); i < args.size(); ++i)
			name += " " + args[i];
		auto action = Action();
		if (!parse_action(name, action))
			throw ConfigError("unknown action: " + name);
		auto address = args[1];
		return start_modules("create").then([this, address, action]() {
			return coordinator->create(address, action, *signer);
		}).then([this, address]() {
			print_pending(address);
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_approve() {
		if (args.size() != 2)
			throw ConfigError("approve needs ADDRESS");
		auto address = args[1];
		return start_modules("approve").then([this, address]() {
			return coordinator->approve(address, *signer);
		}).then([this, address](bool executed) {
			auto js = Json::Out()
				.start_object()
					.field("address", address)
					.field("executed", executed)
				.end_object()
				;
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_reject() {
		if (args.size() != 2)
			throw ConfigError("reject needs ADDRESS");
		auto address = args[1];
		return start_modules("reject").then([this, address]() {
			return coordinator->reject(address, signer->pubkey());
		}).then([this, address]() {
			print_pending(address);
			return Ev::lift();
		});
	}

	Ev::Io<void> cmd_execute() {
		if (args.size() != 2)
			throw ConfigError("execute needs ADDRESS");
		auto address = args[1];
		return start_modules("execute").then([this, address]() {
			return coordinator->execute(address);
		}).then([this](std::string txid) {
			auto js = Json::Out()
				.start_object()
					.field("arkTxid", txid)
				.end_object()
				;
			cout << js.output() << std::endl;
			return Ev::lift();
		});
	}

	Ev::Io<void> dispatch() {
		return Ev::lift().then([this]() {
			if (args.empty())
				throw ConfigError("no command given");
			auto const& cmd = args[0];
			if (cmd == "info")
				return cmd_info();
			if (cmd == "address")
				return cmd_address();
			if (cmd == "list")
				return cmd_list();
			if (cmd == "state")
				return cmd_state();
			if (cmd == "wallet")
				return cmd_wallet();
			if (cmd == "open")
				return cmd_open();
			if (cmd == "create")
				return cmd_create();
			if (cmd == "approve")
				return cmd_approve();
			if (cmd == "reject")
				return cmd_reject();
			if (cmd == "execute")
				return cmd_execute();
			throw ConfigError("unknown command: " + cmd);
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , argv0(argv.empty() ? "vescrow" : argv[0])
	      , exit_code(0)
	      {
		if (!argv.empty())
			argv.erase(argv.begin());
		args = std::move(argv);
	}

	Ev::Io<int> run() {
		try {
			config = Config::parse(args);
		} catch (ConfigError const& e) {
			cerr << argv0 << ": " << e.what() << std::endl
			     << Config::usage(argv0);
			return Ev::lift(1);
		}
		if (config.version) {
			cout << "vescrow " << PACKAGE_VERSION << std::endl;
			return Ev::lift(0);
		}
		if (config.help) {
			cout << Config::usage(argv0);
			return Ev::lift(0);
		}
		args = config.arguments;

		bus = Util::make_unique<S::Bus>();
		sink = Util::make_unique<LogSink>(*bus, config.log_level, cerr);
		threadpool = Util::make_unique<Ev::ThreadPool>();
		client = Util::make_unique<Ark::Client>(*threadpool, config.ark_url);

		return dispatch().catching<ConfigError>([this](ConfigError const& e) {
			cerr << argv0 << ": " << e.what() << std::endl
			     << Config::usage(argv0);
			exit_code = 1;
			return Ev::lift();
		}).catching<std::exception>([this](std::exception const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			exit_code = 1;
			return Ev::lift();
		}).then([this]() {
			return bus->raise(Msg::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(Util::make_unique<Impl>(std::move(argv), cout, cerr)) { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
