/*
 * factory.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_FACTORY_HPP_
#define LIB_LAZYCTX_FACTORY_HPP_

#include <functional>
#include <lazyctx/defs.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/value.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace lazyctx {

class factory {
public:
	using function = std::function<value(context &, const key &)>;

	factory() = default;

	factory(function f, std::string label) :
		_function{std::move(f)},
		_label{std::move(label)} {}

	factory(const factory &) = default;
	factory(factory &&) = default;
	factory &operator=(const factory &) = default;
	factory &operator=(factory &&) = default;

	// Accepts f(context &, const key &), f(const key &) or f(), returning a
	// value, a std::shared_ptr or a plain object.
	template <typename callable>
	static factory of(callable f, std::string label = "<anonymous>") {
		return factory{[f](context &ctx, const key &k) mutable -> value {
						   return to_value(call(f, ctx, k));
					   },
					   std::move(label)};
	}

	// Like of(), but the result is stored as instance_type, so a factory
	// may return an implementation of an interface.
	template <typename instance_type, typename callable>
	static factory typed(callable f, std::string label) {
		return factory{[f](context &ctx, const key &k) mutable -> value {
						   return to_value_as<instance_type>(call(f, ctx, k));
					   },
					   std::move(label)};
	}

	value operator()(context &ctx, const key &k) const {
		return _function(ctx, k);
	}

	const std::string &label() const { return _label; }

	explicit operator bool() const { return static_cast<bool>(_function); }

private:
	template <typename callable>
	static decltype(auto) call(callable &f, context &ctx, const key &k) {
		if constexpr (std::is_invocable_v<callable &, context &, const key &>)
			return f(ctx, k);
		else if constexpr (std::is_invocable_v<callable &, const key &>)
			return f(k);
		else
			return f();
	}

	function _function;
	std::string _label;
};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_FACTORY_HPP_ */
