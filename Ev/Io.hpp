#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

using FailFunc = std::function<void(std::exception_ptr)>;

/* The a in the Io<a> returned by a `then` callback.  */
template<typename f, typename a>
struct ThenResult {
	using type = typename IoInner<typename std::result_of<f(a)>::type>::type;
};
template<typename f>
struct ThenResult<f, void> {
	using type = typename IoInner<typename std::result_of<f()>::type>::type;
};

/* Wraps a pass function so that only the first of
 * pass or fail is ever honored.  */
template<typename a>
struct Once {
	static
	typename PassFunc<a>::type
	pass(std::shared_ptr<bool> done, typename PassFunc<a>::type f) {
		return [done, f](a value) {
			if (*done)
				return;
			*done = true;
			f(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static
	PassFunc<void>::type
	pass(std::shared_ptr<bool> done, PassFunc<void>::type f) {
		return [done, f]() {
			if (*done)
				return;
			*done = true;
			f();
		};
	}
};

/* Continuation for `then`, split on whether the
 * value passed along is void.  */
template<typename a, typename b>
struct Bind {
	template<typename f>
	static
	typename PassFunc<a>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , FailFunc fail
	    );
};

}

/** class Ev::Io<a>
 *
 * @brief an action that, when run, eventually
 * either yields a value of type `a` or fails
 * with an exception.
 *
 * @desc Actions are sequenced with `then` and
 * errors intercepted with `catching`.
 * Nothing executes until the action is handed
 * to `Ev::start`, `Ev::concurrent`, or `run`.
 */
template<typename a>
class Io {
public:
	typedef
	std::function<void ( typename Detail::PassFunc<a>::type
			   , Detail::FailFunc
			   )> CoreFunc;

private:
	CoreFunc core;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b
	 * For Io<void>, func takes no arguments.  */
	template<typename f>
	Io<typename Detail::ThenResult<f, a>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<f, a>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			core_copy( Detail::Bind<a, b>::make(func, pass, fail)
				 , fail
				 );
		});
	}

	/* Handles exceptions of type e thrown by this
	 * action, replacing them with the handler's
	 * action.  Other exceptions pass through.  */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename Detail::PassFunc<a>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_fail = [pass, fail, handler](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					handler(ex).run(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			Io<a>(core_copy).run(pass, sub_fail);
		});
	}

	void run( typename Detail::PassFunc<a>::type pass
		, Detail::FailFunc fail
		) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto sub_fail = [done, fail](std::exception_ptr e) {
			if (*done)
				return;
			*done = true;
			fail(std::move(e));
		};
		try {
			core(Detail::Once<a>::pass(done, std::move(pass)), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

namespace Detail {

template<typename a, typename b>
template<typename f>
typename PassFunc<a>::type
Bind<a, b>::make( f func
		, typename PassFunc<b>::type pass
		, FailFunc fail
		) {
	return [func, pass, fail](a value) {
		try {
			func(std::move(value)).run(pass, fail);
		} catch (...) {
			fail(std::current_exception());
		}
	};
}

template<typename b>
struct Bind<void, b> {
	template<typename f>
	static
	PassFunc<void>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , FailFunc fail
	    ) {
		return [func, pass, fail]() {
			try {
				func().run(pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		};
	}
};

}

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/* Sequence two actions.  */
inline
Io<void> operator+(Io<void> a, Io<void> b) {
	return a.then([b]() { return b; });
}
inline
Io<void>& operator+=(Io<void>& a, Io<void> b) {
	a = a + std::move(b);
	return a;
}

}

#endif /* !defined(EV_IO_HPP) */
