#include <doctest/doctest.h>

#include <lazyctx/lazyctx.hpp>

#include <memory>
#include <string>
#include <type_traits>

namespace {

using namespace lazyctx;

struct global_setting {
	std::string name = "default";
};

struct counting_policy : public resolution_policy_base {
	int calls = 0;

	value resolve(context &, const key &) override {
		++calls;
		return make_value<int>(calls);
	}
};

} // namespace

TEST_SUITE("global_context") {
TEST_CASE("use() is a single shared instance") {
	CHECK(&use() == &global_context::shared());
}

TEST_CASE("calls outside a factory throw no_active_context") {
	key number = key::token("number");
	CHECK_THROWS_WITH_AS(use()(number), "No current context",
						 no_active_context);
	CHECK_THROWS_WITH_AS(use().current(), "No current context",
						 no_active_context);
	CHECK_THROWS_AS(use().get<global_setting>(), no_active_context);
	CHECK_THROWS_AS(use().invoke(number), no_active_context);
}

TEST_CASE("inside a factory use() reads from the running context") {
	key number = key::token("number");
	key something = key::token("something");
	context ctx = use().fork();
	ctx.set_value(number, 42);
	ctx.define(something, [=]() { return *use().get<int>(number); });
	CHECK(*ctx.get<int>(something) == 42);
}

TEST_CASE("invoke on the root records a dependency of the running factory") {
	key number = key::token("number");
	key something = key::token("something");
	context parent = use().fork();
	parent.set_value(number, 1).define(something, [=]() {
		return *use().invoke(number).as<int>() + 1;
	});
	CHECK(*parent.get<int>(something) == 2);

	context child = parent.fork();
	child.set_value(number, 5);
	CHECK(*child.get<int>(something) == 6);
}

TEST_CASE("current() is the context running the factory") {
	key self = key::token("self");
	context ctx = use().fork();
	ctx.define(self, []() { return use().current(); });
	CHECK(*ctx.get<context>(self) == ctx);
	CHECK_THROWS_AS(use().current(), no_active_context);
}

TEST_CASE("current() follows nested factories across contexts") {
	key outer = key::token("outer");
	key inner = key::token("inner");
	context first = use().fork();
	context second = use().fork();
	second.define(inner, []() { return use().current(); });
	first.define(outer, [&]() {
		context before = use().current();
		context nested = *second.get<context>(inner);
		context after = use().current();
		return (before == first) && (nested == second) && (after == first);
	});
	CHECK(*first.get<bool>(outer));
}

TEST_CASE("defaults set on the root are inherited by every fork") {
	key greeting = key::token("greeting");
	use().set_value(greeting, std::string{"hello"});
	CHECK(*use().fork().get<std::string>(greeting) == "hello");
	CHECK(*use().fork().fork().get<std::string>(greeting) == "hello");
}

TEST_CASE("factories defined on the root run in the reading context") {
	key where = key::token("where");
	key label = key::token("label");
	use().define(where, [=]() { return *use().get<std::string>(label); });

	context first = use().fork();
	first.set_value(label, std::string{"first"});
	context second = use().fork();
	second.set_value(label, std::string{"second"});
	CHECK(*first.get<std::string>(where) == "first");
	CHECK(*second.get<std::string>(where) == "second");

	// the root never resolves, so it stays configurable
	use().define(where, []() { return std::string{"changed"}; });
	CHECK(*use().fork().get<std::string>(where) == "changed");
}

TEST_CASE("typed defaults can be provided on the root") {
	struct root_only {
		int n = 0;
	};
	use().set_value(std::make_shared<root_only>(root_only{11}));
	CHECK(use().fork().get<root_only>()->n == 11);
}

TEST_CASE("fork(key) on the root resolves in a new top level context") {
	key number = key::token("number");
	use().define(number, []() { return 5; });
	CHECK(*use().fork(number).as<int>() == 5);
}

TEST_CASE("the default factory token is the recipe tag") {
	constexpr bool is_tag =
		std::is_same_v<decltype(use().default_factory_token()),
					   default_factory_t>;
	CHECK(is_tag);
}

TEST_CASE("a replaced policy applies to later forks only") {
	key unknown = key::token("unknown");
	context before = use().fork();
	std::shared_ptr<counting_policy> counting =
		std::make_shared<counting_policy>();
	policy_ptr previous = before.scope()->policy();

	use().set_policy(counting);
	context after = use().fork();
	use().set_policy(previous);

	CHECK(*after.get<int>(unknown) == 1);
	CHECK(counting->calls == 1);
	CHECK_THROWS_AS(before.invoke(unknown), no_configuration);
	CHECK(*after.fork().get<int>(unknown) == 1);
}
}
