#ifndef POOL_ERROR_HPP
#define POOL_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Pool {

/* Bad configuration, detected before any tree
 * construction or node contact.  */
struct ConfigError : public Util::BacktraceException<std::invalid_argument> {
	explicit
	ConfigError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Pool::ConfigError: " + msg
		  ) { }
};

/* The tree could not be built; no partial tree
 * is ever handed out.  */
struct BuildError : public Util::BacktraceException<std::runtime_error> {
	explicit
	BuildError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Pool::BuildError: " + msg
		  ) { }
};

/* A settlement request the tree has no answer for:
 * unknown exit history, repeated or unknown exiter,
 * or a step after the pool has been fully paid out.
 */
struct ResolveError : public Util::BacktraceException<std::logic_error> {
	explicit
	ResolveError(std::string const& msg)
		: Util::BacktraceException<std::logic_error>(
			"Pool::ResolveError: " + msg
		  ) { }
};

/* The rebuilt transaction does not hash to the
 * commitment its leaf carries.  Funds would be
 * stuck if this were broadcast.  */
struct CommitmentMismatch : public ResolveError {
	explicit
	CommitmentMismatch(std::string const& msg)
		: ResolveError("commitment mismatch: " + msg) { }
};

/* The node refused or failed a request.  The
 * request can be retried.  */
struct NodeError : public Util::BacktraceException<std::runtime_error> {
	explicit
	NodeError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

}

#endif /* !defined(POOL_ERROR_HPP) */
