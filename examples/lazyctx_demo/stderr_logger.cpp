/*
 * stderr_logger.cpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#include "stderr_logger.hpp"
#include <iostream>
#include <lazyctx/context.hpp>
#include <lazyctx/key.hpp>

std::shared_ptr<logger> logger::use_me(lazyctx::default_factory_t,
									   lazyctx::context &, const lazyctx::key &) {
	return std::make_shared<stderr_logger>();
}

void stderr_logger::log(std::string_view scope, std::string_view message) {
	++_lines;
	std::cerr << "[" << scope << "] " << message << std::endl;
}

stderr_logger::~stderr_logger() {
	std::cerr << "Logger deinitialized after " << _lines << " lines."
			  << std::endl;
}
