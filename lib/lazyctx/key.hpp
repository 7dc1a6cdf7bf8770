/*
 * key.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_KEY_HPP_
#define LIB_LAZYCTX_KEY_HPP_

#include <concepts>
#include <functional>
#include <lazyctx/defs.hpp>
#include <lazyctx/utils.hpp>
#include <lazyctx/value.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <variant>

namespace lazyctx {

template <class instance_type>
concept has_recipe =
	requires(context &ctx, const key &k) {
		{ instance_type::use_me(default_factory, ctx, k) };
	};

template <class instance_type>
concept default_constructible_service =
	std::default_initializable<instance_type> && !std::is_abstract_v<instance_type>;

// Identity of a requested thing. The shape is fixed when the key is made:
// a named token, a type, or a standalone recipe carrying its own factory.
class key {
public:
	enum class shape { token, type, recipe };

	using recipe_function = std::function<value(context &, const key &)>;

	static key token(std::string name) {
		return key{named{std::make_shared<const symbol>(
			symbol{std::move(name), nullptr})}};
	}

	static key recipe(std::string name, recipe_function make) {
		return key{recipe_of{std::make_shared<const symbol>(
			symbol{std::move(name), std::move(make)})}};
	}

	template <typename instance_type> static key of() {
		typed t{std::type_index{typeid(instance_type)}, nullptr, nullptr};
		if constexpr (has_recipe<instance_type>)
			t.recipe = &key::typed_recipe<instance_type>;
		if constexpr (default_constructible_service<instance_type>)
			t.maker = &key::typed_maker<instance_type>;
		return key{t};
	}

	key(const key &) = default;
	key(key &&) = default;
	key &operator=(const key &) = default;
	key &operator=(key &&) = default;

	shape kind() const { return static_cast<shape>(_shape.index()); }

	bool has_own_recipe() const {
		if (const typed *t = std::get_if<typed>(&_shape))
			return nullptr != t->recipe;
		return std::holds_alternative<recipe_of>(_shape);
	}

	bool constructible() const {
		const typed *t = std::get_if<typed>(&_shape);
		return (nullptr != t) && (nullptr != t->maker);
	}

	value run_recipe(context &ctx) const;

	value construct() const;

	std::string description() const;

	bool operator==(const key &other) const;

	std::size_t hash() const;

private:
	struct symbol {
		std::string name;
		recipe_function make;
	};

	struct named {
		std::shared_ptr<const symbol> identity;
	};

	struct typed {
		std::type_index type;
		value (*maker)();
		value (*recipe)(context &, const key &);
	};

	struct recipe_of {
		std::shared_ptr<const symbol> identity;
	};

	using shape_store = std::variant<named, typed, recipe_of>;

	explicit key(shape_store s) :
		_shape{std::move(s)} {}

	template <typename instance_type> static value typed_maker() {
		return value{std::make_shared<instance_type>()};
	}

	template <typename instance_type>
	static value typed_recipe(context &ctx, const key &k) {
		return to_value(instance_type::use_me(default_factory, ctx, k));
	}

	shape_store _shape;
};

//==============================================================================

inline value key::run_recipe(context &ctx) const {
	if (const typed *t = std::get_if<typed>(&_shape))
		return t->recipe(ctx, *this);

	return std::get<recipe_of>(_shape).identity->make(ctx, *this);
}

inline value key::construct() const { return std::get<typed>(_shape).maker(); }

inline std::string key::description() const {
	switch (kind()) {
	case shape::token:
		return std::get<named>(_shape).identity->name;
	case shape::type:
		return type_name(std::get<typed>(_shape).type);
	case shape::recipe:
		return std::get<recipe_of>(_shape).identity->name;
	}
	return std::string{};
}

inline bool key::operator==(const key &other) const {
	if (_shape.index() != other._shape.index())
		return false;

	switch (kind()) {
	case shape::token:
		return std::get<named>(_shape).identity ==
			   std::get<named>(other._shape).identity;
	case shape::type:
		return std::get<typed>(_shape).type ==
			   std::get<typed>(other._shape).type;
	case shape::recipe:
		return std::get<recipe_of>(_shape).identity ==
			   std::get<recipe_of>(other._shape).identity;
	}
	return false;
}

inline std::size_t key::hash() const {
	std::size_t seed = 0;
	boost::hash_combine(seed, _shape.index());
	switch (kind()) {
	case shape::token:
		boost::hash_combine(seed, std::get<named>(_shape).identity.get());
		break;
	case shape::type:
		boost::hash_combine(seed,
							std::get<typed>(_shape).type.hash_code());
		break;
	case shape::recipe:
		boost::hash_combine(seed,
							std::get<recipe_of>(_shape).identity.get());
		break;
	}
	return seed;
}

} // namespace lazyctx

namespace std {

template <> struct hash<lazyctx::key> {
	std::size_t operator()(const lazyctx::key &k) const { return k.hash(); }
};

} // namespace std

#endif /* LIB_LAZYCTX_KEY_HPP_ */
