#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Pool/Rpc.hpp"
#include"Util/make_unique.hpp"
#include<atomic>
#include<cstdint>
#include<curl/curl.h>
#include<sstream>
#include<vector>

#ifndef PACKAGE_VERSION
# define PACKAGE_VERSION "0"
#endif

namespace {

/* Creates a CURL easy handle for one JSON-RPC
 * call, then executes it.  */
class EasyHandle {
private:
	Jsmn::Parser parser;
	Jsmn::Object result;
	bool has_result;
	std::string parse_error;

	std::vector<char> errbuf;

	curl_slist* headers;
	CURL* curl;

	EasyHandle() {
		errbuf.resize(CURL_ERROR_SIZE);
		for (auto& b : errbuf)
			b = 0;
		has_result = false;
		headers = NULL;
		headers = curl_slist_append(headers
					   , "Content-Type: application/json"
					   );
		curl = curl_easy_init();
		if (!curl) {
			curl_slist_free_all(headers);
			throw Pool::NodeError("curl_easy_init failed");
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
			, std::string const& userpwd
			, std::string const& body
			) {
		EasyHandle self;
		self.run_core(url, userpwd, body);
		if (!self.has_result)
			throw Pool::NodeError("empty reply from " + url);
		return std::move(self.result);
	}

private:
	static
	size_t write_cb_s(char* ptr, size_t size, size_t nmemb, void* vself) {
		return ((EasyHandle*)vself)->write_cb(ptr, size * nmemb);
	}
	size_t write_cb(char* ptr, size_t size) {
		auto str = std::string(ptr, size);
		try {
			auto results = parser.feed(str);
			if (results.size() > 0 && !has_result) {
				has_result = true;
				result = std::move(results[0]);
			}
		} catch (std::exception const& e) {
			parse_error = e.what();
			/* Tell libcurl to abort the transfer.  */
			return 0;
		}
		return size;
	}
	void run_core( std::string const& url
		     , std::string const& userpwd
		     , std::string const& body
		     ) {
		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb_s);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		if (userpwd != ":") {
			curl_easy_setopt(curl, CURLOPT_HTTPAUTH, (long) CURLAUTH_BASIC);
			curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
		}
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
		curl_easy_setopt( curl, CURLOPT_POSTFIELDSIZE_LARGE
				, (curl_off_t) body.size()
				);
		curl_easy_setopt( curl, CURLOPT_USERAGENT
				, "ctvpool/" PACKAGE_VERSION
				);
		curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK && !parse_error.empty())
			throw Pool::NodeError("RPC to " + url + ": bad reply: " + parse_error);
		if (ret != CURLE_OK) {
			auto msg = std::string(curl_easy_strerror(ret))
				 + ": "
				 + std::string(&errbuf[0])
				 ;
			throw Pool::NodeError("RPC to " + url + " failed: " + msg);
		}
		/* bitcoind replies 500 with a JSON error body
		 * for failed commands, so only refuse
		 * bodyless failures here.  */
		auto http_code = long(0);
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
		if (http_code == 401 || http_code == 403)
			throw Pool::NodeError(
				"RPC to " + url + " refused: check credentials"
			);
	}
};

}

namespace Pool {

std::string
RpcError::make_error_message( std::string const& command
			    , Jsmn::Object const& error
			    ) {
	auto os = std::ostringstream();
	os << "RPC error: " << command << ": " << error;
	return os.str();
}

RpcError::RpcError(std::string command_, Jsmn::Object error_)
	: NodeError(make_error_message(command_, error_))
	, command(std::move(command_))
	, error(std::move(error_))
	{ }

int RpcError::code() const {
	if (!error.is_object() || !error.has("code"))
		return 0;
	auto c = error["code"];
	if (!c.is_number())
		return 0;
	return int(double(c));
}

class Rpc::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::string url;
	std::string userpwd;
	std::atomic<std::uint64_t> next_id;

public:
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	Impl( Ev::ThreadPool& threadpool_
	    , std::string url_
	    , std::string user
	    , std::string password
	    ) : threadpool(threadpool_)
	      , url(std::move(url_))
	      , userpwd(user + ":" + password)
	      , next_id(0)
	      { }

	Ev::Io<Jsmn::Object>
	command(std::string const& method, Json::Out params) {
		auto id = next_id++;
		auto body = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("1.0"))
				.field("id", id)
				.field("method", method)
				.field("params", params)
			.end_object()
			.output()
			;
		return threadpool.background<Jsmn::Object>([ this
							   , body
							   ]() {
			return EasyHandle::run(url, userpwd, body);
		}).then([method](Jsmn::Object reply) {
			if (!reply.is_object())
				throw NodeError("RPC " + method + ": reply is not an object");
			auto error = reply["error"];
			if (!error.is_null())
				throw RpcError(method, error);
			return Ev::lift(reply["result"]);
		});
	}
};

Rpc::Rpc( Ev::ThreadPool& threadpool
	, std::string url
	, std::string user
	, std::string password
	) : pimpl(Util::make_unique<Impl>( threadpool
					 , std::move(url)
					 , std::move(user)
					 , std::move(password)
					 ))
	  { }
Rpc::Rpc(Rpc&&) =default;
Rpc::~Rpc() =default;

Ev::Io<Jsmn::Object>
Rpc::command(std::string const& command, Json::Out params) {
	return pimpl->command(command, std::move(params));
}

}
