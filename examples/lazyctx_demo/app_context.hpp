/*
 * app_context.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef EXAMPLES_LAZYCTX_DEMO_APP_CONTEXT_HPP_
#define EXAMPLES_LAZYCTX_DEMO_APP_CONTEXT_HPP_

#include <lazyctx/lazyctx.hpp>
#include <string>

struct settings {
	std::string greeting;
};

class app_context {
public:
	// Number of the request being served, set on each request fork.
	static const lazyctx::key request_id;

	// Root defaults shared by every context of the application.
	static void configure(const std::string &greeting);

	static lazyctx::context fork_request(const lazyctx::context &app,
										 int id);
};

#endif /* EXAMPLES_LAZYCTX_DEMO_APP_CONTEXT_HPP_ */
