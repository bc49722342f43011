#ifndef POOL_OPEN_BITCOIND_HPP
#define POOL_OPEN_BITCOIND_HPP

#include"Bitcoin/Network.hpp"
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }
namespace Pool { class NodeIF; }

namespace Pool {

/* A `Pool::Bitcoind` together with the RPC client
 * it talks through.  Does no I/O until used.  */
std::unique_ptr<NodeIF>
open_bitcoind( Ev::ThreadPool& threadpool
	     , Bitcoin::Network network
	     , std::string const& url
	     , std::string const& user
	     , std::string const& password
	     );

}

#endif /* !defined(POOL_OPEN_BITCOIND_HPP) */
