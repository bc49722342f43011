#undef NDEBUG
#include"Bitcoin/scriptPubKey_to_addr.hpp"
#include"Pool/Config.hpp"
#include"Pool/Error.hpp"
#include"Pool/Participant.hpp"
#include"Pool/log.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<string>
#include<vector>

namespace {

bool rejected(Pool::Config const& c) {
	try {
		c.validate();
	} catch (Pool::ConfigError const&) {
		return true;
	}
	return false;
}

std::string regtest_addr(std::uint8_t fill) {
	auto spk = std::vector<std::uint8_t>(22, fill);
	spk[0] = 0x00;
	spk[1] = 0x14;
	return Bitcoin::scriptPubKey_to_addr(spk, Bitcoin::Network::Regtest);
}

}

int main() {
	auto c = Pool::Config();
	assert(c.network == Bitcoin::Network::Regtest);
	assert(c.users == 3);
	assert(c.tx_version == 2);
	assert(c.lock_time == 0);
	assert(c.sequence == 0xfffffffd);
	assert(Util::Str::hexdump(c.fee_anchor_spk) == "51024e73");
	assert(Util::Str::hexdump(Pool::p2a_script()) == "51024e73");
	assert(!rejected(c));

	/* User count bounds.  */
	c.users = 2;
	assert(rejected(c));
	c.users = Pool::Config::max_users + 1;
	assert(rejected(c));
	c.users = Pool::Config::max_users;
	assert(!rejected(c));

	/* Each exit must leave the exiter more than dust.  */
	c = Pool::Config();
	c.amount_per_user = Bitcoin::Amount::sat(1546);
	assert(rejected(c));
	c.amount_per_user = Bitcoin::Amount::sat(2547);
	assert(!rejected(c));
	/* ...and so must the last user.  */
	c.users = 4;
	c.amount_per_user = Bitcoin::Amount::sat(3000);
	assert(rejected(c));
	c.users = 3;
	assert(!rejected(c));

	c = Pool::Config();
	c.fee_anchor_spk.clear();
	assert(rejected(c));

	/* The pool cannot hold more than every bitcoin
	 * there is, nor can the amounts saturate.  */
	c = Pool::Config();
	c.amount_per_user = Bitcoin::Amount::sat(700000000000000ULL);
	assert(!rejected(c));
	assert(c.total() == Bitcoin::Amount::max_money());
	c.amount_per_user = Bitcoin::Amount::sat(700000000000001ULL);
	assert(rejected(c));
	c.amount_per_user = Bitcoin::Amount::sat(std::uint64_t(1) << 63);
	assert(rejected(c));
	c.amount_per_user = Bitcoin::Amount::sat(2100000000000000ULL);
	assert(rejected(c));
	c = Pool::Config();
	c.fee = Bitcoin::Amount::max_money() + Bitcoin::Amount::sat(1);
	c.amount_per_user = Bitcoin::Amount::max_money();
	c.users = 3;
	assert(rejected(c));

	/* The amount schedule, and that each step
	 * conserves value.  */
	c = Pool::Config();
	c.users = 4;
	assert(c.total() == Bitcoin::Amount::sat(400000));
	assert(c.node_value(0) == c.total());
	assert(c.node_value(1) == Bitcoin::Amount::sat(299000));
	assert(c.node_value(2) == Bitcoin::Amount::sat(198000));
	assert(c.payout() == Bitcoin::Amount::sat(99000));
	assert(c.terminal_residual() == Bitcoin::Amount::sat(97000));
	for (auto k = std::size_t(0); k + 2 < c.users; ++k)
		assert( c.node_value(k)
		     == c.payout() + c.fee + c.fee + c.node_value(k + 1)
		      );
	assert( c.node_value(c.users - 2)
	     == c.payout() + c.fee + c.fee + c.terminal_residual()
	      );

	/* Participants.  */
	{
		auto ps = Pool::make_participants(
			{regtest_addr(1), regtest_addr(2), regtest_addr(3)},
			Bitcoin::Network::Regtest
		);
		assert(ps.size() == 3);
		for (auto i = std::size_t(0); i < ps.size(); ++i) {
			assert(ps[i].index == i);
			assert(ps[i].scriptPubKey.size() == 22);
			assert(ps[i].scriptPubKey[2] == i + 1);
		}

		auto threw = false;
		try {
			Pool::Participant::make(
				0,
				"bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4",
				Bitcoin::Network::Regtest
			);
		} catch (Pool::ConfigError const&) {
			threw = true;
		}
		assert(threw);
	}

	/* Log levels.  */
	assert(Pool::log_level_from_string("debug") == Pool::Debug);
	assert(Pool::log_level_from_string("error") == Pool::Error);
	assert(std::string(Pool::to_string(Pool::Warn)) == "WARN");
	{
		auto threw = false;
		try {
			Pool::log_level_from_string("loud");
		} catch (Pool::ConfigError const&) {
			threw = true;
		}
		assert(threw);
	}

	return 0;
}
