#include"Ark/Client.hpp"
#include"Bitcoin/Psbt.hpp"
#include"Escrow/Contract.hpp"
#include"Escrow/Error.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<curl/curl.h>
#include<sodium/utils.h>

namespace {

/* One request with a fresh CURL easy handle.
 * A null body means GET, otherwise POST the body as JSON.
 */
class EasyHandle {
private:
	std::string response;
	std::vector<char> errbuf;

	curl_slist* headers;
	CURL* curl;

	EasyHandle() : errbuf(CURL_ERROR_SIZE, 0), headers(nullptr) {
		headers = curl_slist_append( headers
					   , "Content-Type: application/json"
					   );
		headers = curl_slist_append(headers, "Accept: application/json");
		curl = curl_easy_init();
		if (!curl) {
			curl_slist_free_all(headers);
			throw Escrow::NetworkError("curl_easy_init failed");
		}
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
	}
	~EasyHandle() {
		curl_easy_cleanup(curl);
		curl_slist_free_all(headers);
	}

public:
	static
	Jsmn::Object run( std::string const& url
			, std::shared_ptr<Json::Out> body
			) {
		EasyHandle self;
		self.run_core(url, body);
		try {
			return Jsmn::Object::parse_json(self.response);
		} catch (Jsmn::ParseError const& e) {
			throw Escrow::NetworkError( url + ": unparseable reply: "
						  + e.what()
						  );
		}
	}

private:
	static
	size_t write_cb_s(char* ptr, size_t size, size_t nmemb, void* vself) {
		auto self = (EasyHandle*) vself;
		self->response.append(ptr, size * nmemb);
		return size * nmemb;
	}

	void run_core( std::string const& url
		     , std::shared_ptr<Json::Out> const& body
		     ) {
		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb_s);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
		/* Needs to survive until after curl_easy_perform.  */
		auto postfields = std::string();
		if (body) {
			postfields = body->output();
			curl_easy_setopt( curl, CURLOPT_POSTFIELDS
					, postfields.c_str()
					);
			curl_easy_setopt( curl, CURLOPT_POSTFIELDSIZE_LARGE
					, (curl_off_t) postfields.size()
					);
		}
		curl_easy_setopt(curl, CURLOPT_USERAGENT, "vescrow/1.0");
		curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 50L);
		curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK) {
			auto msg = url + ": "
				 + std::string(curl_easy_strerror(ret))
				 + ": "
				 + std::string(&errbuf[0])
				 ;
			throw Escrow::NetworkError(msg);
		}
		long status = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
		if (status >= 400)
			throw Escrow::NetworkError( url + ": HTTP "
						  + std::to_string(status)
						  + ": " + response
						  );
	}
};

/* The server writes 64-bit numbers as strings.  */
std::uint64_t number(Jsmn::Object const& o) {
	if (o.is_string())
		return std::stoull(std::string(o));
	if (o.is_number())
		return std::uint64_t(double(o));
	return 0;
}

std::string text(Jsmn::Object const& o) {
	if (o.is_string())
		return std::string(o);
	return "";
}

Escrow::Vtxo parse_vtxo(Jsmn::Object const& v) {
	auto outpoint = v["outpoint"];
	return Escrow::Vtxo{ Bitcoin::TxId(std::string(outpoint["txid"]))
			   , std::uint32_t(number(outpoint["vout"]))
			   , number(v["amount"])
			   , text(v["spentBy"])
			   };
}

}

namespace Ark {

std::string base64(std::vector<std::uint8_t> const& data) {
	auto len = sodium_base64_encoded_len( data.size()
					    , sodium_base64_VARIANT_ORIGINAL
					    );
	auto buf = std::vector<char>(len);
	sodium_bin2base64( &buf[0], len
			 , data.empty() ? nullptr : &data[0], data.size()
			 , sodium_base64_VARIANT_ORIGINAL
			 );
	return std::string(&buf[0]);
}

class Client::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::string base_url;

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::string base_url_
	    ) : threadpool(threadpool_)
	      , base_url(std::move(base_url_))
	      { }

	/* Format errors in the reply become NetworkError too.  */
	template<typename a>
	Ev::Io<a> call( std::string path
		      , std::shared_ptr<Json::Out> body
		      , std::function<a(Jsmn::Object const&)> parse
		      ) {
		auto url = base_url + path;
		return threadpool.background<a>([url, body, parse]() {
			auto js = EasyHandle::run(url, body);
			try {
				return parse(js);
			} catch (Escrow::NetworkError const&) {
				throw;
			} catch (std::invalid_argument const& e) {
				throw Escrow::NetworkError( url + ": bad reply: "
							  + e.what()
							  );
			} catch (std::runtime_error const& e) {
				throw Escrow::NetworkError( url + ": bad reply: "
							  + e.what()
							  );
			}
		});
	}
};

Client::Client(Ev::ThreadPool& threadpool, std::string base_url)
	: pimpl(Util::make_unique<Impl>(threadpool, std::move(base_url))) { }
Client::~Client() { }

Ev::Io<ServerInfo> Client::get_info() {
	return pimpl->call<ServerInfo>( "/v1/info", nullptr
				      , [](Jsmn::Object const& js) {
		auto signer = Util::Str::hexread(std::string(js["signerPubkey"]));
		return ServerInfo{ Secp256k1::XonlyPubKey::from_compressed(signer)
				 , std::uint32_t(number(js["unilateralExitDelay"]))
				 , text(js["network"])
				 };
	});
}

Ev::Io<std::vector<Escrow::Vtxo>>
Client::get_unspent_outputs(std::vector<std::uint8_t> pk_script) {
	auto path = "/v1/indexer/vtxos?scripts="
		  + Util::Str::hexdump(pk_script)
		  ;
	return pimpl->call<std::vector<Escrow::Vtxo>>( path, nullptr
						     , [](Jsmn::Object const& js) {
		auto rv = std::vector<Escrow::Vtxo>();
		auto vtxos = js["vtxos"];
		if (!vtxos.is_array())
			return rv;
		for (auto v : vtxos)
			rv.push_back(parse_vtxo(v));
		return rv;
	});
}

Ev::Io<std::string>
Client::submit( Bitcoin::Psbt spend
	      , std::vector<Bitcoin::Psbt> checkpoints
	      ) {
	auto body = std::make_shared<Json::Out>();
	auto obj = body->start_object();
	obj.field("signedArkTx", base64(spend.to_bytes()));
	auto arr = obj.start_array("checkpointTxs");
	for (auto const& c : checkpoints)
		arr.entry(base64(c.to_bytes()));
	arr.end_array();
	obj.end_object();
	return pimpl->call<std::string>( "/v1/tx/submit", body
				       , [](Jsmn::Object const& js) {
		auto id = text(js["arkTxid"]);
		if (id.empty())
			throw Escrow::NetworkError("submit: no arkTxid in reply");
		return id;
	});
}

Ev::Io<void>
Client::finalize( std::string reference
		, std::vector<Bitcoin::Psbt> checkpoints
		) {
	auto body = std::make_shared<Json::Out>();
	auto obj = body->start_object();
	obj.field("arkTxid", reference);
	auto arr = obj.start_array("finalCheckpointTxs");
	for (auto const& c : checkpoints)
		arr.entry(base64(c.to_bytes()));
	arr.end_array();
	obj.end_object();
	return pimpl->call<bool>( "/v1/tx/finalize", body
				, [](Jsmn::Object const&) {
		return true;
	}).then([](bool) {
		return Ev::lift();
	});
}

}
