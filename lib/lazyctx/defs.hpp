/*
 * defs.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_DEFS_HPP_
#define LIB_LAZYCTX_DEFS_HPP_

#include <boost/container_hash/hash.hpp>
#include <boost/core/demangle.hpp>
#include <memory>

namespace lazyctx {

namespace core = boost::core; // from <boost/core/demangle.hpp>

class key;
class value;
class factory;
class context;
class weak_context;
class registry;
class global_context;
class resolution_policy_base;

using registry_ptr = std::shared_ptr<registry>;
using policy_ptr = std::shared_ptr<resolution_policy_base>;

// Tag selecting a type's own construction recipe:
// static std::shared_ptr<T> use_me(default_factory_t, context &, const key &)
struct default_factory_t {
	explicit default_factory_t() = default;
};

inline constexpr default_factory_t default_factory{};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_DEFS_HPP_ */
