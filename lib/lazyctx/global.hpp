/*
 * global.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_GLOBAL_HPP_
#define LIB_LAZYCTX_GLOBAL_HPP_

#include <lazyctx/ambient.hpp>
#include <lazyctx/context.hpp>
#include <lazyctx/defs.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/policy.hpp>
#include <lazyctx/registry.hpp>
#include <memory>
#include <string>
#include <utility>

namespace lazyctx {

// Global defaults. Configuration lands in the root registry that every
// top-level fork inherits from; lookups are forwarded to whichever context
// is running a factory on this thread.
class global_context {
public:
	global_context(const global_context &) = delete;
	global_context(global_context &&) = delete;
	global_context &operator=(const global_context &) = delete;
	global_context &operator=(global_context &&) = delete;

	static global_context &shared() {
		static global_context obj;
		return obj;
	}

	context current() const {
		const registry_ptr &active = ambient::active();
		if (nullptr == active)
			throw no_active_context{};

		return context{active};
	}

	value operator()(const key &k) const { return invoke(k); }

	value invoke(const key &k) const { return current().invoke(k); }

	template <typename instance_type>
	std::shared_ptr<instance_type> get(const key &k) const {
		return current().get<instance_type>(k);
	}

	template <typename instance_type>
	std::shared_ptr<instance_type> get() const {
		return current().get<instance_type>();
	}

	global_context &define(const key &k, factory f) {
		_defaults.define(k, std::move(f));
		return *this;
	}

	template <typename callable>
	global_context &define(const key &k, callable f,
						   std::string label = "<anonymous>") {
		_defaults.define(k, std::move(f), std::move(label));
		return *this;
	}

	template <typename instance_type, typename callable>
	global_context &define(callable f) {
		_defaults.define<instance_type>(std::move(f));
		return *this;
	}

	global_context &set_value(const key &k, value v) {
		_defaults.set_value(k, std::move(v));
		return *this;
	}

	template <typename value_type>
	global_context &set_value(const key &k, value_type &&v) {
		_defaults.set_value(k, std::forward<value_type>(v));
		return *this;
	}

	template <typename instance_type>
	global_context &set_value(std::shared_ptr<instance_type> instance) {
		_defaults.set_value(std::move(instance));
		return *this;
	}

	context fork() const { return _defaults.fork(); }

	value fork(const key &k) const { return _defaults.fork(k); }

	default_factory_t default_factory_token() const { return default_factory; }

	// Applies to contexts forked after the call.
	global_context &set_policy(policy_ptr p) {
		_defaults.scope()->set_policy(std::move(p));
		return *this;
	}

private:
	global_context() :
		_defaults{std::make_shared<registry>(nullptr,
											 make_policy<default_policy>())} {}

	context _defaults;
};

inline global_context &use() { return global_context::shared(); }

} // namespace lazyctx

#endif /* LIB_LAZYCTX_GLOBAL_HPP_ */
