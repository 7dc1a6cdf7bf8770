/*
 * catalog.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef EXAMPLES_LAZYCTX_DEMO_CATALOG_HPP_
#define EXAMPLES_LAZYCTX_DEMO_CATALOG_HPP_

#include "app_context.hpp"
#include "logger.hpp"
#include <memory>
#include <string>
#include <string_view>

// Built from the settings and logger of whichever context resolves it.
class catalog {
public:
	catalog();

	std::string describe(std::string_view item) const;

	static int instances() { return _instances; }

private:
	std::shared_ptr<settings> _settings;
	std::shared_ptr<logger> _logger;

	static inline int _instances = 0;
};

#endif /* EXAMPLES_LAZYCTX_DEMO_CATALOG_HPP_ */
