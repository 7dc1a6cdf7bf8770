/*
 * lazyctx_demo.cpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#include "app_context.hpp"
#include "catalog.hpp"
#include "logger.hpp"
#include "request_handler.hpp"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <lazyctx/lazyctx.hpp>
#include <memory>
#include <string>
#include <string_view>

int main(int argc, char **argv) {
	// Check command line arguments.
	if (argc < 2) {
		std::cerr << "Usage: lazyctx_demo <greeting> [item...]" << std::endl
				  << "Items starting with '!' are served with their own "
					 "settings."
				  << std::endl
				  << "Example:" << std::endl
				  << "    lazyctx_demo Hello world !loud" << std::endl;
		return EXIT_FAILURE;
	}

	app_context::configure(argv[1]);

	lazyctx::context app = lazyctx::use().fork();
	lazyctx::lazy_ptr<logger> log{app};
	log->log("main", "It works!");

	// Requests share this catalog unless they change what it was built from.
	app.get<catalog>();

	for (int i = 2; i < argc; ++i) {
		std::string_view item{argv[i]};
		lazyctx::context request = app_context::fork_request(app, i - 1);
		if (item.starts_with('!')) {
			item.remove_prefix(1);
			request.set_value(std::make_shared<settings>(
				settings{std::string{argv[1]} + "!!!"}));
		}

		try {
			request.get<request_handler>()->handle(item);
		} catch (const std::exception &e) {
			log->log("main", std::string{"Request failed: "} + e.what());
			return EXIT_FAILURE;
		}
	}

	log->log("main", std::to_string(catalog::instances()) +
						 " catalog instance(s) built.");
	return EXIT_SUCCESS;
}
