/*
 * catalog.cpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#include "catalog.hpp"

catalog::catalog() :
	_settings{lazyctx::use().get<settings>()},
	_logger{lazyctx::use().get<logger>()} {
	++_instances;
	_logger->log("catalog", "built catalog #" + std::to_string(_instances) +
								" greeting with \"" + _settings->greeting +
								"\"");
}

std::string catalog::describe(std::string_view item) const {
	return _settings->greeting + ", " + std::string{item};
}
