/*
 * context.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_CONTEXT_HPP_
#define LIB_LAZYCTX_CONTEXT_HPP_

#include <concepts>
#include <exception>
#include <lazyctx/ambient.hpp>
#include <lazyctx/defs.hpp>
#include <lazyctx/entry.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/factory.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/policy.hpp>
#include <lazyctx/registry.hpp>
#include <lazyctx/value.hpp>
#include <memory>
#include <string>
#include <utility>

namespace lazyctx {

// Handle over exactly one registry. Copies share the registry; handles
// compare equal when they do.
class context {
public:
	explicit context(registry_ptr r) :
		_registry{std::move(r)} {}

	context(const context &) = default;
	context(context &&) = default;
	context &operator=(const context &) = default;
	context &operator=(context &&) = default;

	value operator()(const key &k) const { return invoke(k); }

	value invoke(const key &k) const;

	template <typename instance_type>
	std::shared_ptr<instance_type> get(const key &k) const {
		return invoke(k).as<instance_type>();
	}

	template <typename instance_type>
	std::shared_ptr<instance_type> get() const {
		return get<instance_type>(key::of<instance_type>());
	}

	context &define(const key &k, factory f) {
		_registry->assign(k, entry_state::pending_factory, std::move(f));
		return *this;
	}

	template <typename callable>
	context &define(const key &k, callable f,
					std::string label = "<anonymous>") {
		return define(k, factory::of(std::move(f), std::move(label)));
	}

	// The result may be any std::shared_ptr convertible to instance_type.
	template <typename instance_type, typename callable>
	context &define(callable f) {
		return define(key::of<instance_type>(),
					  factory::typed<instance_type>(
						  std::move(f), type_name<instance_type>()));
	}

	context &set_value(const key &k, value v) {
		_registry->assign(k, entry_state::pending_value, std::move(v));
		return *this;
	}

	template <typename value_type>
	context &set_value(const key &k, value_type &&v) {
		return set_value(k, to_value(std::forward<value_type>(v)));
	}

	template <typename instance_type>
	context &set_value(std::shared_ptr<instance_type> instance) {
		return set_value(key::of<instance_type>(), value{std::move(instance)});
	}

	context fork() const {
		return context{std::make_shared<registry>(_registry, _registry->policy())};
	}

	value fork(const key &k) const { return fork().invoke(k); }

	const registry_ptr &scope() const { return _registry; }

	weak_context weak() const;

	bool operator==(const context &other) const {
		return _registry == other._registry;
	}

private:
	void run_factory(entry &e, const key &k) const;
	void revalidate(entry &e) const;

	registry_ptr _registry;
};

// Non-owning handle for objects that are themselves cached in the context
// they refer to.
class weak_context {
public:
	weak_context() = default;

	explicit weak_context(const context &ctx) :
		_registry{ctx.scope()} {}

	weak_context(const weak_context &) = default;
	weak_context(weak_context &&) = default;
	weak_context &operator=(const weak_context &) = default;
	weak_context &operator=(weak_context &&) = default;

	context lock() const {
		registry_ptr r = _registry.lock();
		if (nullptr == r)
			throw expired_context{};

		return context{std::move(r)};
	}

	bool expired() const { return _registry.expired(); }

	bool operator==(const context &ctx) const {
		return _registry.lock() == ctx.scope();
	}

private:
	std::weak_ptr<registry> _registry;
};

inline weak_context context::weak() const { return weak_context{*this}; }

// An object exposing the context it was built in, so callers can take either.
template <class candidate>
concept useful = requires(candidate &c) {
	{ c.use } -> std::convertible_to<const weak_context &>;
};

inline context context_of(const context &ctx) { return ctx; }

template <useful candidate> context context_of(const candidate &obj) {
	return obj.use.lock();
}

//==============================================================================

inline value context::invoke(const key &k) const {
	entry &e = _registry->materialize(k);

	for (;;) {
		switch (e.state()) {
		case entry_state::resolved:
			ambient::record(_registry.get(), k);
			return e.cached_value();
		case entry_state::failed:
			std::rethrow_exception(e.error());
		case entry_state::pending_factory:
			run_factory(e, k);
			break;
		case entry_state::pending_value:
			revalidate(e);
			break;
		case entry_state::resolving:
			e.fail(std::make_exception_ptr(unresolved_cycle{
				e.pending_factory().label(), k.description()}));
			break;
		case entry_state::empty:
			e.reset(entry_state::pending_factory,
					policy_factory(_registry->policy()));
			break;
		}
	}
}

inline void context::run_factory(entry &e, const key &k) const {
	factory f = e.pending_factory();
	e.set_state(entry_state::resolving);

	key_log keys;
	try {
		context self{*this};
		value v = ambient::execute(_registry, &keys,
								   [&]() { return f(self, k); });

		// A cycle through this key has already cached its error.
		if (entry_state::resolving != e.state())
			return;

		e.resolve(std::move(v));
		if (!keys.empty())
			e.record_dependencies(
				dependency_record{_registry, std::move(f), std::move(keys)});
	} catch (...) {
		if (entry_state::resolving == e.state())
			e.fail(std::current_exception());
	}
}

inline void context::revalidate(entry &e) const {
	if (!e.dependencies()) {
		e.set_state(entry_state::resolved);
		return;
	}

	dependency_record deps = *e.dependencies();
	registry_ptr origin = deps.origin.lock();

	bool unchanged =
		origin && ambient::execute(_registry, nullptr, [&]() {
			context origin_context{origin};
			for (const key &dep : deps.keys_read) {
				if (!invoke(dep).same_as(origin_context.invoke(dep)))
					return false;
			}
			return true;
		});

	if (unchanged) {
		e.set_state(entry_state::resolved);
		return;
	}

	e.reset(entry_state::pending_factory, std::move(deps.origin_factory));
}

} // namespace lazyctx

#endif /* LIB_LAZYCTX_CONTEXT_HPP_ */
