#ifndef POOL_RPC_HPP
#define POOL_RPC_HPP

#include"Jsmn/Object.hpp"
#include"Pool/Error.hpp"
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace Json { class Out; }

namespace Pool {

/* bitcoind answered with a non-null `error`.  */
struct RpcError : public NodeError {
private:
	static
	std::string make_error_message( std::string const&
				      , Jsmn::Object const&
				      );
public:
	RpcError() =delete;
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	Jsmn::Object error;

	/* The JSON-RPC error code, 0 if absent.  */
	int code() const;
};

/** class Pool::Rpc
 *
 * @brief JSON-RPC 1.0 client for bitcoind, over
 * HTTP with basic authentication.
 *
 * @desc Each command blocks a thread of the
 * given thread pool, not the main loop.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc() =delete;
	Rpc( Ev::ThreadPool& threadpool
	   , std::string url
	   , std::string user
	   , std::string password
	   );
	Rpc(Rpc&&);
	~Rpc();

	/* Returns the `result` member.  `params` must
	 * be a JSON array.  Throws `Pool::RpcError` or,
	 * on transport failure, `Pool::NodeError`.  */
	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    );
};

}

#endif /* !defined(POOL_RPC_HPP) */
