/*
 * value.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_VALUE_HPP_
#define LIB_LAZYCTX_VALUE_HPP_

#include <lazyctx/defs.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/utils.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace lazyctx {

// Numbers, enums and strings are compared by content, everything else by
// address.
template <typename instance_type>
concept compared_by_content =
	std::is_arithmetic_v<instance_type> || std::is_enum_v<instance_type> ||
	std::is_same_v<instance_type, std::string>;

// Shared, type-erased handle. Copies alias the same instance, and identity
// is the instance address together with its type.
class value {
public:
	value() = default;

	template <typename instance_type>
	explicit value(std::shared_ptr<instance_type> instance) :
		_instance{std::move(instance)},
		_type{typeid(instance_type)} {
		if constexpr (compared_by_content<std::remove_cv_t<instance_type>>)
			_equal = &value::equal_contents<std::remove_cv_t<instance_type>>;
	}

	value(const value &) = default;
	value(value &&) = default;
	value &operator=(const value &) = default;
	value &operator=(value &&) = default;

	const std::type_index &type() const { return _type; }

	void *get() const { return _instance.get(); }

	template <typename instance_type> bool holds() const {
		return _type == std::type_index{typeid(instance_type)};
	}

	template <typename instance_type>
	std::shared_ptr<instance_type> as() const {
		if (!holds<instance_type>())
			throw bad_value_cast{type_name(_type), type_name<instance_type>()};

		return std::static_pointer_cast<instance_type>(_instance);
	}

	bool same_as(const value &other) const {
		if (_type != other._type)
			return false;

		if (_instance.get() == other._instance.get())
			return true;

		return _equal && _instance && other._instance &&
			   _equal(_instance.get(), other._instance.get());
	}

	explicit operator bool() const { return _instance != nullptr; }

private:
	template <typename instance_type>
	static bool equal_contents(const void *lhs, const void *rhs) {
		return *static_cast<const instance_type *>(lhs) ==
			   *static_cast<const instance_type *>(rhs);
	}

	std::shared_ptr<void> _instance;
	std::type_index _type{typeid(void)};
	bool (*_equal)(const void *, const void *) = nullptr;
};

template <typename instance_type, typename... arg_types>
value make_value(arg_types &&...args) {
	return value{
		std::make_shared<instance_type>(std::forward<arg_types>(args)...)};
}

template <typename candidate> struct is_shared_ptr : std::false_type {};

template <typename instance_type>
struct is_shared_ptr<std::shared_ptr<instance_type>> : std::true_type {};

// Factory results may be a value, a shared pointer or a plain object.
template <typename result_type> value to_value(result_type &&result) {
	using plain_type = std::remove_cvref_t<result_type>;
	if constexpr (std::is_same_v<plain_type, value>)
		return std::forward<result_type>(result);
	else if constexpr (is_shared_ptr<plain_type>::value)
		return value{std::forward<result_type>(result)};
	else
		return make_value<plain_type>(std::forward<result_type>(result));
}

// Same as to_value, but the result is stored as instance_type so that a
// derived object can stand for its base.
template <typename instance_type, typename result_type>
value to_value_as(result_type &&result) {
	using plain_type = std::remove_cvref_t<result_type>;
	if constexpr (std::is_same_v<plain_type, value>)
		return std::forward<result_type>(result);
	else if constexpr (is_shared_ptr<plain_type>::value)
		return value{
			std::shared_ptr<instance_type>{std::forward<result_type>(result)}};
	else
		return value{std::shared_ptr<instance_type>{
			std::make_shared<plain_type>(std::forward<result_type>(result))}};
}

} // namespace lazyctx

#endif /* LIB_LAZYCTX_VALUE_HPP_ */
