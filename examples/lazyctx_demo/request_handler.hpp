/*
 * request_handler.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef EXAMPLES_LAZYCTX_DEMO_REQUEST_HANDLER_HPP_
#define EXAMPLES_LAZYCTX_DEMO_REQUEST_HANDLER_HPP_

#include "catalog.hpp"
#include "logger.hpp"
#include <lazyctx/lazy_ptr.hpp>
#include <memory>
#include <string_view>

class request_handler {
public:
	request_handler();

	void handle(std::string_view item);

private:
	int _id;
	std::shared_ptr<logger> _logger;
	lazyctx::lazy_ptr<catalog> _catalog;
};

#endif /* EXAMPLES_LAZYCTX_DEMO_REQUEST_HANDLER_HPP_ */
