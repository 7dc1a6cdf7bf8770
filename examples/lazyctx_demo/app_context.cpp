/*
 * app_context.cpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#include "app_context.hpp"
#include <memory>

const lazyctx::key app_context::request_id = lazyctx::key::token("request id");

void app_context::configure(const std::string &greeting) {
	lazyctx::use()
		.set_value(std::make_shared<settings>(settings{greeting}))
		.set_value(request_id, 0);
}

lazyctx::context app_context::fork_request(const lazyctx::context &app,
										   int id) {
	lazyctx::context request = app.fork();
	request.set_value(request_id, id);
	return request;
}
