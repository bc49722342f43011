#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief a stateful jsmn-based parser.
 *
 * @desc If previously-fed data is not yet a
 * complete JSON datum, `feed` returns an empty
 * vector, and later calls append to it until
 * at least one datum is complete.
 * This lets an HTTP body be fed in the chunks
 * it arrives in.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&) =delete;

	/* Throws `Jsmn::ParseError` on malformed input.  */
	std::vector<Jsmn::Object> feed(std::string const&);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
