#include <doctest/doctest.h>

#include <lazyctx/ambient.hpp>
#include <lazyctx/lazyctx.hpp>

#include <memory>
#include <stdexcept>

namespace {

using namespace lazyctx;

registry_ptr make_scope() {
	return std::make_shared<registry>(nullptr, make_policy<default_policy>());
}

} // namespace

TEST_SUITE("ambient") {
TEST_CASE("nothing is active outside execute") {
	CHECK(ambient::active() == nullptr);
	CHECK_FALSE(ambient::is_active(nullptr));
}

TEST_CASE("execute installs and restores the active registry") {
	registry_ptr outer = make_scope();
	registry_ptr inner = make_scope();

	int result = ambient::execute(outer, nullptr, [&]() {
		CHECK(ambient::is_active(outer.get()));
		ambient::execute(inner, nullptr, [&]() {
			CHECK(ambient::is_active(inner.get()));
			CHECK_FALSE(ambient::is_active(outer.get()));
		});
		CHECK(ambient::is_active(outer.get()));
		return 3;
	});

	CHECK(result == 3);
	CHECK(ambient::active() == nullptr);
}

TEST_CASE("execute restores the previous frame when the function throws") {
	registry_ptr outer = make_scope();
	registry_ptr inner = make_scope();
	key_log log;

	ambient::execute(outer, &log, [&]() {
		CHECK_THROWS_AS(ambient::execute(inner, nullptr,
										 []() -> int {
											 throw std::runtime_error{"boom"};
										 }),
						std::runtime_error);
		CHECK(ambient::is_active(outer.get()));
		ambient::record(outer.get(), key::token("after"));
	});

	CHECK(ambient::active() == nullptr);
	CHECK(log.size() == 1);
}

TEST_CASE("record only logs reads of the active registry") {
	registry_ptr tracked = make_scope();
	registry_ptr other = make_scope();
	key_log log;
	key k = key::token("k");

	ambient::execute(tracked, &log, [&]() {
		ambient::record(other.get(), k);
		ambient::record(tracked.get(), k);
	});
	REQUIRE(log.size() == 1);
	CHECK(log[0] == k);

	ambient::record(tracked.get(), k);
	CHECK(log.size() == 1);
}

TEST_CASE("nested executions keep separate logs") {
	registry_ptr scope = make_scope();
	key_log outer_log;
	key_log inner_log;
	key a = key::token("a");
	key b = key::token("b");

	ambient::execute(scope, &outer_log, [&]() {
		ambient::record(scope.get(), a);
		ambient::execute(scope, &inner_log,
						 [&]() { ambient::record(scope.get(), b); });
		ambient::execute(scope, nullptr,
						 [&]() { ambient::record(scope.get(), b); });
	});

	REQUIRE(outer_log.size() == 1);
	CHECK(outer_log[0] == a);
	REQUIRE(inner_log.size() == 1);
	CHECK(inner_log[0] == b);
}
}
