/*
 * utils.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_UTILS_HPP_
#define LIB_LAZYCTX_UTILS_HPP_

#include <functional>
#include <lazyctx/defs.hpp>
#include <string>
#include <typeindex>

namespace lazyctx {

inline std::string type_name(const std::type_index &type) {
	return core::demangle(type.name());
}

template <typename value_type> std::string type_name() {
	return type_name(std::type_index{typeid(value_type)});
}

class defer {
public:
	template <typename functor>
	defer(functor on_delete) :
		_on_delete(on_delete) {}

	defer(const defer &) = delete;
	defer &operator=(const defer &) = delete;

	~defer() { _on_delete(); }

private:
	std::function<void()> _on_delete;
};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_UTILS_HPP_ */
