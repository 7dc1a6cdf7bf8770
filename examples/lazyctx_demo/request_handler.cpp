/*
 * request_handler.cpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#include "request_handler.hpp"
#include <string>

request_handler::request_handler() :
	_id{*lazyctx::use().get<int>(app_context::request_id)},
	_logger{lazyctx::use().get<logger>()} {}

void request_handler::handle(std::string_view item) {
	_logger->log("request " + std::to_string(_id), _catalog->describe(item));
}
