#include <doctest/doctest.h>

#include <lazyctx/value.hpp>

#include <memory>
#include <string>

namespace {

using namespace lazyctx;

struct base {
	virtual ~base() = default;
};

struct derived : base {};

struct point {
	int x = 0;

	bool operator==(const point &) const = default;
};

} // namespace

TEST_SUITE("value") {
TEST_CASE("copies of a value are the same instance") {
	value original = make_value<std::string>("text");
	value copy = original;
	CHECK(copy.same_as(original));
	CHECK(copy.get() == original.get());
	CHECK(*copy.as<std::string>() == "text");
}

TEST_CASE("equal numbers and strings are the same value") {
	CHECK(make_value<int>(1).same_as(make_value<int>(1)));
	CHECK_FALSE(make_value<int>(1).same_as(make_value<int>(2)));
	CHECK(make_value<std::string>("a").same_as(make_value<std::string>("a")));
	CHECK_FALSE(make_value<int>(1).same_as(make_value<long>(1)));
}

TEST_CASE("equal objects in different instances are not the same value") {
	value first = make_value<point>(point{1});
	value second = make_value<point>(point{1});
	CHECK_FALSE(first.same_as(second));
}

TEST_CASE("typed access checks the stored type exactly") {
	value v{std::make_shared<derived>()};
	CHECK(v.holds<derived>());
	CHECK_FALSE(v.holds<base>());
	CHECK(v.as<derived>() != nullptr);
	CHECK_THROWS_AS(v.as<base>(), bad_value_cast);
	CHECK_THROWS_AS(make_value<int>(1).as<std::string>(), bad_value_cast);
}

TEST_CASE("the same instance seen as different types is not the same value") {
	std::shared_ptr<derived> instance = std::make_shared<derived>();
	value as_derived{instance};
	value as_base{std::shared_ptr<base>{instance}};
	CHECK_FALSE(as_derived.same_as(as_base));
}

TEST_CASE("to_value keeps values and pointers and wraps plain objects") {
	value original = make_value<int>(5);
	CHECK(to_value(original).same_as(original));

	std::shared_ptr<std::string> text = std::make_shared<std::string>("t");
	CHECK(to_value(text).as<std::string>() == text);

	value wrapped = to_value(std::string{"plain"});
	CHECK(*wrapped.as<std::string>() == "plain");
}

TEST_CASE("to_value_as stores an implementation under its base type") {
	std::shared_ptr<derived> instance = std::make_shared<derived>();
	value as_base = to_value_as<base>(instance);
	CHECK(as_base.holds<base>());
	CHECK(as_base.as<base>().get() == instance.get());
	CHECK(to_value_as<base>(derived{}).holds<base>());
}

TEST_CASE("an empty value is falsy") {
	value empty;
	CHECK_FALSE(static_cast<bool>(empty));
	CHECK(static_cast<bool>(make_value<int>(0)));
	CHECK(empty.holds<void>());
}
}
