#include"Bitcoin/Amount.hpp"
#include"Bitcoin/OutPoint.hpp"
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/addr_to_scriptPubKey.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Pool/Config.hpp"
#include"Pool/Error.hpp"
#include"Pool/Main.hpp"
#include"Pool/NodeIF.hpp"
#include"Pool/Participant.hpp"
#include"Pool/Settlement.hpp"
#include"Pool/Tree.hpp"
#include"Pool/log.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<cstdlib>
#include<sstream>

#ifndef PACKAGE_VERSION
# define PACKAGE_VERSION "0"
#endif

namespace {

std::uint64_t parse_uint(std::string const& name, std::string const& value) {
	/* 19 digits always fit.  */
	auto ok = !value.empty() && value.size() <= 19;
	for (auto c : value)
		if (c < '0' || c > '9')
			ok = false;
	if (!ok)
		throw Pool::ConfigError(
			"--" + name + ": not a number: \"" + value + "\""
		);
	return std::strtoull(value.c_str(), nullptr, 10);
}

Bitcoin::Amount parse_amount(std::string const& name, std::string const& value) {
	if (!Bitcoin::Amount::valid_string(value))
		throw Pool::ConfigError(
			"--" + name + ": not an amount: \"" + value + "\""
		);
	return Bitcoin::Amount(value);
}

void print_usage(std::ostream& os, std::string const& argv0) {
	os << "Usage: " << argv0 << " [options]" << std::endl
	   << std::endl
	   << "Creates a CTV payment pool, funds it from the bitcoind wallet," << std::endl
	   << "and settles it one exiting user at a time." << std::endl
	   << std::endl
	   << "Options:" << std::endl
	   << " --network=NAME          main, test, testnet4, signet or regtest (default regtest)." << std::endl
	   << " --rpc-url=URL           bitcoind RPC URL (default from the network)." << std::endl
	   << " --rpc-user=USER         RPC user name." << std::endl
	   << " --rpc-password=PASS     RPC password." << std::endl
	   << " --users=N               Number of users (default 3)." << std::endl
	   << " --amount-per-user=SAT   Share of each user (default 100000)." << std::endl
	   << " --fee=SAT               Fee per exit transaction (default 1000)." << std::endl
	   << " --dust=SAT              Dust limit (default 546)." << std::endl
	   << " --fee-anchor-addr=ADDR  Anchor output address (default pay-to-anchor)." << std::endl
	   << " --tx-version=V          Transaction version (default 2)." << std::endl
	   << " --withdraw-addrs=A,B,.. Pay users here instead of new wallet addresses." << std::endl
	   << " --exit-order=I,J,..     Order users exit in (default 0,1,2,...)." << std::endl
	   << " --dry-run               Build the tree and print it; no RPC." << std::endl
	   << " --log-level=LEVEL       trace, debug, info, warn or error (default info)." << std::endl
	   << " --version, -V           Show version." << std::endl
	   << " --help, -h              Show this help." << std::endl
	   ;
}

}

namespace Pool {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;
	NodeOpener open_node;

	std::string argv0;
	bool is_version;
	bool is_help;
	bool dry_run;
	/* Empty if the command line parsed.  */
	std::string parse_error;

	Config config;
	std::string rpc_url;
	std::string rpc_user;
	std::string rpc_password;
	std::string fee_anchor_addr;
	std::vector<std::string> withdraw_addrs;
	std::vector<std::size_t> exit_order;

	Logger logger;

	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<NodeIF> node;
	std::vector<std::string> addresses;
	std::vector<Participant> participants;
	std::unique_ptr<Tree> tree;
	std::unique_ptr<Settlement> settlement;

	void parse_arg(std::string const& arg) {
		if (arg == "--version" || arg == "-V") {
			is_version = true;
			return;
		}
		if (arg == "--help" || arg == "-h") {
			is_help = true;
			return;
		}
		if (arg == "--dry-run") {
			dry_run = true;
			return;
		}

		auto eq = arg.find('=');
		if (arg.substr(0, 2) != "--" || eq == std::string::npos)
			throw ConfigError("unrecognized option: " + arg);
		auto name = arg.substr(2, eq - 2);
		auto value = arg.substr(eq + 1);

		if (name == "network") {
			try {
				config.network = Bitcoin::network_from_string(value);
			} catch (Bitcoin::UnknownNetwork const&) {
				throw ConfigError("--network: unknown network: " + value);
			}
		} else if (name == "rpc-url")
			rpc_url = value;
		else if (name == "rpc-user")
			rpc_user = value;
		else if (name == "rpc-password")
			rpc_password = value;
		else if (name == "users")
			config.users = std::size_t(parse_uint(name, value));
		else if (name == "amount-per-user")
			config.amount_per_user = parse_amount(name, value);
		else if (name == "fee")
			config.fee = parse_amount(name, value);
		else if (name == "dust")
			config.dust = parse_amount(name, value);
		else if (name == "fee-anchor-addr")
			fee_anchor_addr = value;
		else if (name == "tx-version") {
			auto v = parse_uint(name, value);
			if (v > 0xFFFFFFFF)
				throw ConfigError("--tx-version: out of range: " + value);
			config.tx_version = std::uint32_t(v);
		} else if (name == "withdraw-addrs")
			withdraw_addrs = Util::Str::split(value, ',');
		else if (name == "exit-order") {
			exit_order.clear();
			for (auto const& s : Util::Str::split(value, ','))
				exit_order.push_back(std::size_t(parse_uint(name, s)));
		} else if (name == "log-level")
			logger.set_level(log_level_from_string(value));
		else
			throw ConfigError("unrecognized option: --" + name);
	}

	/* Everything that can be checked without the
	 * node, so bad input never costs a round trip.  */
	void check_config() {
		if (!fee_anchor_addr.empty()) {
			try {
				config.fee_anchor_spk = Bitcoin::addr_to_scriptPubKey(
					fee_anchor_addr, config.network
				);
			} catch (Bitcoin::UnknownAddrType const&) {
				throw ConfigError( "--fee-anchor-addr: invalid "
						 + Bitcoin::to_string(config.network)
						 + " address: " + fee_anchor_addr
						 );
			}
		}
		config.validate();

		if (!withdraw_addrs.empty()) {
			if (withdraw_addrs.size() != config.users)
				throw ConfigError(Util::Str::fmt(
					"--withdraw-addrs: %zu addresses for %zu users",
					withdraw_addrs.size(), config.users
				));
			participants = make_participants(withdraw_addrs, config.network);
		} else if (dry_run)
			throw ConfigError("--dry-run requires --withdraw-addrs");

		if (exit_order.empty()) {
			for (auto i = std::size_t(0); i < config.users; ++i)
				exit_order.push_back(i);
		}
		if ( exit_order.size() != config.users
		  && exit_order.size() != config.users - 1
		   )
			throw ConfigError(Util::Str::fmt(
				"--exit-order: need %zu or %zu users, got %zu",
				config.users - 1, config.users, exit_order.size()
			));
		auto sorted = exit_order;
		std::sort(sorted.begin(), sorted.end());
		if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
			throw ConfigError("--exit-order: user repeated");
		if (sorted.back() >= config.users)
			throw ConfigError(Util::Str::fmt(
				"--exit-order: no user %zu", sorted.back()
			));
	}

	bool regtest() const {
		return config.network == Bitcoin::Network::Regtest;
	}

	Ev::Io<void> bootstrap() {
		if (!regtest())
			return Ev::lift();
		return node->get_balance().then([this](Bitcoin::Amount balance) {
			if (balance >= config.total())
				return Ev::lift();
			return logger.log( Info
					 , "Wallet has %s, mining 101 blocks."
					 , std::string(balance).c_str()
					 ).then([this]() {
				return node->generate(101);
			});
		});
	}

	Ev::Io<void> collect_addresses() {
		if (addresses.size() >= config.users)
			return Ev::lift();
		return node->new_address().then([this](std::string addr) {
			addresses.push_back(std::move(addr));
			return collect_addresses();
		});
	}

	Ev::Io<void> get_participants() {
		auto act = Ev::lift();
		if (participants.empty())
			act = collect_addresses().then([this]() {
				participants = make_participants(
					addresses, config.network
				);
				return Ev::lift();
			});
		return act.then([this]() {
			auto act = Ev::lift();
			for (auto const& p : participants)
				act += logger.log( Info
						 , "User %zu withdraws to %s"
						 , p.index
						 , p.address.c_str()
						 );
			return act;
		});
	}

	Ev::Io<void> build_tree() {
		return threadpool->background<Tree>([this]() {
			return Tree::build(config, participants);
		}).then([this](Tree t) {
			tree = Util::make_unique<Tree>(std::move(t));
			return logger.log( Info
					 , "Built %zu taproot nodes; root %s"
					 , tree->size()
					 , tree->root().taproot.address.c_str()
					 );
		});
	}

	void print_summary() {
		auto const& root = tree->root();
		cout << "network: " << Bitcoin::to_string(config.network) << std::endl
		     << "users: " << config.users << std::endl
		     << "total: " << config.total() << std::endl
		     << "nodes: " << tree->size() << std::endl
		     << "root: " << root.taproot.address << std::endl
		     << "root scriptPubKey: "
		     << Util::Str::hexdump(root.taproot.scriptPubKey) << std::endl
		     ;
		for (auto const& l : root.leaves)
			cout << "exit " << l.exiter << ": "
			     << std::string(l.commitment) << std::endl;
	}

	Ev::Io<void> mine_one() {
		if (!regtest())
			return Ev::lift();
		return node->generate(1);
	}

	Ev::Io<Bitcoin::OutPoint> fund() {
		auto const& root = tree->root();
		auto txid = std::make_shared<Bitcoin::TxId>();
		return node->fund(root.taproot.address, config.total())
			.then([this, txid](Bitcoin::TxId t) {
			*txid = t;
			return mine_one();
		}).then([this, txid]() {
			return node->lookup_outputs(*txid);
		}).then([this, txid](std::vector<Bitcoin::TxOut> outs) {
			auto const& spk = tree->root().taproot.scriptPubKey;
			for (auto i = std::size_t(0); i < outs.size(); ++i) {
				if ( outs[i].scriptPubKey == spk
				  && outs[i].amount == config.total()
				   )
					return Ev::lift(Bitcoin::OutPoint(
						*txid, std::uint32_t(i)
					));
			}
			throw NodeError(
				"funding transaction " + std::string(*txid)
				+ " does not pay the pool"
			);
		});
	}

	Ev::Io<void> settle(std::size_t k) {
		if (k >= config.users - 1)
			return Ev::lift();
		auto u = exit_order[k];
		auto prev = std::make_shared<Bitcoin::OutPoint>(
			settlement->outpoint()
		);
		return settlement->step(u).then([this, k, u, prev](Bitcoin::TxId txid) {
			return logger.log( Info
					 , "Step %zu: user %zu exits, %s:%u -> %s"
					 , k + 1
					 , u
					 , std::string(prev->txid).c_str()
					 , (unsigned) prev->vout
					 , std::string(txid).c_str()
					 );
		}).then([this]() {
			return mine_one();
		}).then([this, k]() {
			return settle(k + 1);
		});
	}

	Ev::Io<int> drive() {
		threadpool = Util::make_unique<Ev::ThreadPool>();

		auto start = logger.log( Info
				       , "Pool of %zu users at %s each on %s"
				       , config.users
				       , std::string(config.amount_per_user).c_str()
				       , Bitcoin::to_string(config.network).c_str()
				       );
		if (dry_run)
			return start.then([this]() {
				return get_participants();
			}).then([this]() {
				return build_tree();
			}).then([this]() {
				print_summary();
				return Ev::lift(0);
			});

		node = open_node( *threadpool
				, config.network
				, rpc_url
				, rpc_user
				, rpc_password
				);
		return start.then([this]() {
			return bootstrap();
		}).then([this]() {
			return get_participants();
		}).then([this]() {
			return build_tree();
		}).then([this]() {
			return fund();
		}).then([this](Bitcoin::OutPoint funding) {
			settlement = Util::make_unique<Settlement>(
				*tree, *node, funding
			);
			return logger.log( Info
					 , "Funded pool at %s:%u"
					 , std::string(funding.txid).c_str()
					 , (unsigned) funding.vout
					 );
		}).then([this]() {
			return settle(0);
		}).then([this]() {
			return logger.log( Info
					 , "All %zu users paid out."
					 , config.users
					 );
		}).then([]() {
			return Ev::lift(0);
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , NodeOpener open_node_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , open_node(std::move(open_node_))
	      , is_version(false)
	      , is_help(false)
	      , dry_run(false)
	      , logger(cerr_)
	      {
		argv0 = argv.empty() ? std::string("ctvpool") : argv[0];
		try {
			for (auto i = std::size_t(1); i < argv.size(); ++i)
				parse_arg(argv[i]);
		} catch (ConfigError const& e) {
			parse_error = e.what();
		}
		if (rpc_url.empty())
			rpc_url = "http://127.0.0.1:"
				+ std::to_string(Bitcoin::default_rpc_port(config.network))
				+ "/";
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << "ctvpool " << PACKAGE_VERSION << std::endl;
			return Ev::lift(0);
		}
		if (is_help) {
			print_usage(cout, argv0);
			return Ev::lift(0);
		}
		if (parse_error.empty()) {
			try {
				check_config();
			} catch (ConfigError const& e) {
				parse_error = e.what();
			}
		}
		if (!parse_error.empty()) {
			cerr << argv0 << ": " << parse_error << std::endl;
			print_usage(cerr, argv0);
			return Ev::lift(1);
		}

		return Ev::lift().then([this]() {
			return drive();
		}).catching<std::exception>([this](std::exception const& e) {
			return logger.log(Error, "%s", e.what()).then([]() {
				return Ev::lift(1);
			});
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  , NodeOpener open_node
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   , std::move(open_node)
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
