#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<stdexcept>
#include<string>
#include<utility>

namespace Jsmn {

/** class Jsmn::ParseError
 *
 * @brief thrown on text that is not valid JSON.
 *
 * @desc Keeps the offending input and the byte
 * offset at which jsmn gave up.
 */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	std::string input;
	std::size_t position;

	static
	std::string describe(std::string const& input, std::size_t position) {
		if (position >= input.size())
			return "Jsmn: unexpected end of JSON";
		return "Jsmn: invalid JSON at offset "
		     + std::to_string(position)
		     + ": " + input.substr(position, 24)
		     ;
	}

public:
	ParseError(std::string input_, std::size_t position_)
		: Util::BacktraceException<std::runtime_error>(
			describe(input_, position_)
		  )
		, input(std::move(input_))
		, position(position_)
		{ }

	std::string const& get_input() const { return input; }
	std::size_t get_position() const { return position; }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
