#include"Pool/Config.hpp"
#include"Pool/Error.hpp"
#include"Util/Str.hpp"

namespace Pool {

Config::Config()
	: network(Bitcoin::Network::Regtest)
	, users(3)
	, amount_per_user(Bitcoin::Amount::sat(100000))
	, fee(Bitcoin::Amount::sat(1000))
	, dust(Bitcoin::Amount::sat(546))
	, fee_anchor_spk(p2a_script())
	, tx_version(2)
	, lock_time(0)
	/* Signals RBF, with no relative lock.  */
	, sequence(0xfffffffd)
	{ }

void Config::validate() const {
	if (users < 3)
		throw ConfigError(Util::Str::fmt(
			"need at least 3 users, got %zu", users
		));
	if (users > max_users)
		throw ConfigError(Util::Str::fmt(
			"at most %zu users, got %zu", max_users, users
		));
	/* Checked before any sum, since sums saturate.  */
	auto max_money = Bitcoin::Amount::max_money();
	if (fee > max_money || dust > max_money)
		throw ConfigError(Util::Str::fmt(
			"fee %s or dust %s exceeds the money supply"
			, std::string(fee).c_str()
			, std::string(dust).c_str()
		));
	if (amount_per_user.to_sat() > max_money.to_sat() / users)
		throw ConfigError(Util::Str::fmt(
			"%zu users at %s each exceeds the money supply"
			, users
			, std::string(amount_per_user).c_str()
		));
	if (amount_per_user <= fee + dust)
		throw ConfigError(Util::Str::fmt(
			"amount per user %s must exceed fee %s plus dust %s"
			, std::string(amount_per_user).c_str()
			, std::string(fee).c_str()
			, std::string(dust).c_str()
		));
	/* amount_per_user > fee * (users - 1) + dust, without
	 * the saturating subtraction hiding an underflow.  */
	if (amount_per_user <= fee * (users - 1) + dust)
		throw ConfigError(Util::Str::fmt(
			"last user would receive no more than dust: "
			"amount per user %s, fee %s, %zu users"
			, std::string(amount_per_user).c_str()
			, std::string(fee).c_str()
			, users
		));
	if (fee_anchor_spk.empty())
		throw ConfigError("fee anchor script is empty");
}

Bitcoin::Amount Config::total() const {
	return amount_per_user * users;
}
Bitcoin::Amount Config::node_value(std::size_t exited) const {
	return amount_per_user * (users - exited) - fee * exited;
}
Bitcoin::Amount Config::payout() const {
	return amount_per_user - fee;
}
Bitcoin::Amount Config::terminal_residual() const {
	return amount_per_user - fee * (users - 1);
}

std::vector<std::uint8_t> p2a_script() {
	return std::vector<std::uint8_t>{0x51, 0x02, 0x4e, 0x73};
}

}
