/*
 * entry.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_ENTRY_HPP_
#define LIB_LAZYCTX_ENTRY_HPP_

#include <exception>
#include <lazyctx/defs.hpp>
#include <lazyctx/factory.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/value.hpp>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace lazyctx {

enum class entry_state {
	empty,
	pending_value,
	pending_factory,
	resolving,
	resolved,
	failed
};

using key_log = std::vector<key>;

// How a resolved value was produced: the registry the factory ran in, the
// factory itself and the keys it read there, in read order.
struct dependency_record {
	std::weak_ptr<registry> origin;
	factory origin_factory;
	key_log keys_read;
};

class entry {
public:
	using payload_store =
		std::variant<std::monostate, value, factory, std::exception_ptr>;

	entry() = default;

	entry(entry_state s, payload_store payload) :
		_state{s},
		_payload{std::move(payload)} {}

	entry(const entry &) = default;
	entry(entry &&) = default;
	entry &operator=(const entry &) = default;
	entry &operator=(entry &&) = default;

	entry_state state() const { return _state; }

	void set_state(entry_state s) { _state = s; }

	// Assignment only after a successful read check; drops provenance.
	void reset(entry_state s, payload_store payload) {
		_state = s;
		_payload = std::move(payload);
		_dependencies.reset();
	}

	bool was_read() const {
		return (entry_state::resolved == _state) ||
			   (entry_state::failed == _state) ||
			   (entry_state::resolving == _state);
	}

	const value &cached_value() const { return std::get<value>(_payload); }

	const factory &pending_factory() const {
		return std::get<factory>(_payload);
	}

	const std::exception_ptr &error() const {
		return std::get<std::exception_ptr>(_payload);
	}

	const std::optional<dependency_record> &dependencies() const {
		return _dependencies;
	}

	void record_dependencies(dependency_record deps) {
		_dependencies = std::move(deps);
	}

	void resolve(value v) {
		_state = entry_state::resolved;
		_payload = std::move(v);
	}

	void fail(std::exception_ptr error) {
		_state = entry_state::failed;
		_payload = std::move(error);
		_dependencies.reset();
	}

	// Copy of an ancestor's entry as first seen by a descendant registry.
	entry inherited() const {
		entry copy{*this};
		if (entry_state::resolved == _state)
			copy._state = entry_state::pending_value;
		return copy;
	}

private:
	entry_state _state = entry_state::empty;
	payload_store _payload;
	std::optional<dependency_record> _dependencies;
};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_ENTRY_HPP_ */
