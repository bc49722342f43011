#ifndef POOL_MAIN_HPP
#define POOL_MAIN_HPP

#include"Bitcoin/Network.hpp"
#include<functional>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace Pool { class NodeIF; }

namespace Pool {

/* Connects to the node given on the command line:
 * threadpool, network, url, user, password.  */
typedef std::function< std::unique_ptr<NodeIF>( Ev::ThreadPool&
					      , Bitcoin::Network
					      , std::string const&
					      , std::string const&
					      , std::string const&
					      )
		     > NodeOpener;

/** class Pool::Main
 *
 * @brief the `ctvpool` program: parses the
 * command line, builds the pool tree, funds it
 * and settles it to the end.
 *
 * @desc `run` yields the process exit code.
 * The node opener is only called if the node
 * is actually needed, so `--dry-run`, `--help`
 * and `--version` never touch the network.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    , NodeOpener open_node
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(POOL_MAIN_HPP) */
