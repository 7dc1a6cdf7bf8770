/*
 * policy.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_POLICY_HPP_
#define LIB_LAZYCTX_POLICY_HPP_

#include <concepts>
#include <lazyctx/defs.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/factory.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/value.hpp>
#include <memory>
#include <utility>

namespace lazyctx {

// Fallback for keys nobody configured anywhere up the registry chain.
class resolution_policy_base {
public:
	virtual value resolve(context &ctx, const key &k) = 0;

	virtual ~resolution_policy_base() = default;
};

template <class concrete_policy>
concept resolution_policy =
	std::convertible_to<concrete_policy &, resolution_policy_base &> &&
	std::convertible_to<concrete_policy *, resolution_policy_base *>;

// Recipes first, then default construction of type keys, otherwise
// no_configuration.
class default_policy : public resolution_policy_base {
public:
	value resolve(context &ctx, const key &k) override {
		if (k.has_own_recipe())
			return k.run_recipe(ctx);

		if (k.constructible())
			return k.construct();

		throw no_configuration{k.description()};
	}

	virtual ~default_policy() = default;
};

inline factory policy_factory(policy_ptr p) {
	return factory{[p](context &ctx, const key &k) -> value {
					   return p->resolve(ctx, k);
				   },
				   "<default resolution>"};
}

template <resolution_policy concrete_policy, typename... arg_types>
policy_ptr make_policy(arg_types &&...args) {
	return std::make_shared<concrete_policy>(std::forward<arg_types>(args)...);
}

} // namespace lazyctx

#endif /* LIB_LAZYCTX_POLICY_HPP_ */
