/*
 * logger.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef EXAMPLES_LAZYCTX_DEMO_LOGGER_HPP_
#define EXAMPLES_LAZYCTX_DEMO_LOGGER_HPP_

#include <lazyctx/defs.hpp>
#include <memory>
#include <string_view>

// Resolving key::of<logger>() without configuration yields a stderr_logger.
struct logger {
	virtual void log(std::string_view scope, std::string_view message) = 0;

	static std::shared_ptr<logger> use_me(lazyctx::default_factory_t,
										  lazyctx::context &ctx,
										  const lazyctx::key &k);

	virtual ~logger() = default;
};

#endif /* EXAMPLES_LAZYCTX_DEMO_LOGGER_HPP_ */
