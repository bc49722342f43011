#ifndef POOL_PARTICIPANT_HPP
#define POOL_PARTICIPANT_HPP

#include"Bitcoin/Network.hpp"
#include<cstddef>
#include<cstdint>
#include<string>
#include<vector>

namespace Pool {

/** struct Pool::Participant
 *
 * @brief one user of the pool and where their
 * share is paid.
 */
struct Participant {
	std::size_t index;
	std::string address;
	std::vector<std::uint8_t> scriptPubKey;

	/* Throws `Pool::ConfigError` if the address is
	 * not valid on the given network.  */
	static
	Participant make( std::size_t index
			, std::string address
			, Bitcoin::Network network
			);
};

/* Participants 0..N-1 in address order.  */
std::vector<Participant>
make_participants( std::vector<std::string> const& addresses
		 , Bitcoin::Network network
		 );

}

#endif /* !defined(POOL_PARTICIPANT_HPP) */
