/*
 * lazy_ptr.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_LAZY_PTR_HPP_
#define LIB_LAZYCTX_LAZY_PTR_HPP_

#include <lazyctx/context.hpp>
#include <lazyctx/global.hpp>
#include <lazyctx/key.hpp>
#include <memory>
#include <utility>

namespace lazyctx {

// Pointer to a service that is looked up in its context on first use.
// Default construction binds the context running the current factory.
// The context is not kept alive; resolving after it is gone throws
// expired_context.
template <typename instance_type> class lazy_ptr {
public:
	lazy_ptr() :
		lazy_ptr{use().current()} {}

	explicit lazy_ptr(const context &ctx) :
		lazy_ptr{ctx, key::of<instance_type>()} {}

	lazy_ptr(const context &ctx, key k) :
		_context{ctx.weak()},
		_key{std::move(k)} {}

	lazy_ptr(const lazy_ptr<instance_type> &) = default;
	lazy_ptr(lazy_ptr<instance_type> &&) = default;

	lazy_ptr<instance_type> &operator=(const lazy_ptr<instance_type> &) = default;
	lazy_ptr<instance_type> &operator=(lazy_ptr<instance_type> &&) = default;

	instance_type *get() const { return (this->*_getter)(); }

	instance_type &operator*() const { return *get(); }

	instance_type *operator->() const { return get(); }

	bool resolved() const {
		return _getter == &lazy_ptr<instance_type>::get_resolved;
	}

	context bound_context() const { return _context.lock(); }

private:
	instance_type *get_resolved() const { return _instance.get(); }

	instance_type *get_lazy() const;

	instance_type *(lazy_ptr<instance_type>::*_getter)() const =
		&lazy_ptr<instance_type>::get_lazy;
	weak_context _context;
	key _key;
	std::shared_ptr<instance_type> _instance;
};

//==============================================================================

template <typename instance_type>
instance_type *lazy_ptr<instance_type>::get_lazy() const {
	lazy_ptr<instance_type> &self = const_cast<lazy_ptr<instance_type> &>(*this);
	self._instance = _context.lock().get<instance_type>(_key);
	self._getter = &lazy_ptr<instance_type>::get_resolved;
	return _instance.get();
}

} // namespace lazyctx

#endif /* LIB_LAZYCTX_LAZY_PTR_HPP_ */
