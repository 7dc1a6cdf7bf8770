/*
 * stderr_logger.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef EXAMPLES_LAZYCTX_DEMO_STDERR_LOGGER_HPP_
#define EXAMPLES_LAZYCTX_DEMO_STDERR_LOGGER_HPP_

#include "logger.hpp"
#include <cstddef>

struct stderr_logger : public logger {
	void log(std::string_view scope, std::string_view message) override;

	virtual ~stderr_logger();

private:
	std::size_t _lines = 0;
};

#endif /* EXAMPLES_LAZYCTX_DEMO_STDERR_LOGGER_HPP_ */
