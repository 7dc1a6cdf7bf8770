/*
 * registry.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_REGISTRY_HPP_
#define LIB_LAZYCTX_REGISTRY_HPP_

#include <lazyctx/defs.hpp>
#include <lazyctx/entry.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/policy.hpp>
#include <memory>
#include <unordered_map>
#include <utility>

namespace lazyctx {

// One scope's key -> entry store. Children hold their parent alive and only
// ever read from it; a parent knows nothing about its children.
class registry {
public:
	registry(registry_ptr parent, policy_ptr p) :
		_parent{std::move(parent)},
		_policy{std::move(p)} {}

	registry(const registry &) = delete;
	registry(registry &&) = delete;
	registry &operator=(const registry &) = delete;
	registry &operator=(registry &&) = delete;

	const registry_ptr &parent() const { return _parent; }

	const policy_ptr &policy() const { return _policy; }

	void set_policy(policy_ptr p) { _policy = std::move(p); }

	entry *lookup_local(const key &k);

	entry &materialize(const key &k);

	void assign(const key &k, entry_state s, entry::payload_store payload);

	std::size_t size() const { return _entries.size(); }

private:
	registry_ptr _parent;
	policy_ptr _policy;

	// Node based: entry references survive rehashing by nested lookups.
	std::unordered_map<key, entry> _entries;
};

//==============================================================================

inline entry *registry::lookup_local(const key &k) {
	auto found = _entries.find(k);
	if (_entries.end() == found)
		return nullptr;

	return &found->second;
}

inline entry &registry::materialize(const key &k) {
	if (entry *local = lookup_local(k))
		return *local;

	for (registry *ancestor = _parent.get(); ancestor;
		 ancestor = ancestor->_parent.get()) {
		entry *found = ancestor->lookup_local(k);
		if (found && (entry_state::empty != found->state()))
			return _entries.emplace(k, found->inherited()).first->second;
	}

	return _entries
		.emplace(k, entry{entry_state::pending_factory, policy_factory(_policy)})
		.first->second;
}

inline void registry::assign(const key &k, entry_state s,
							 entry::payload_store payload) {
	if (entry *local = lookup_local(k)) {
		if (local->was_read())
			throw already_read{k.description()};

		local->reset(s, std::move(payload));
		return;
	}

	_entries.emplace(k, entry{s, std::move(payload)});
}

} // namespace lazyctx

#endif /* LIB_LAZYCTX_REGISTRY_HPP_ */
