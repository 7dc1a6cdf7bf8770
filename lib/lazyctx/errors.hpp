/*
 * errors.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_ERRORS_HPP_
#define LIB_LAZYCTX_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace lazyctx {

class already_read : public std::logic_error {
public:
	explicit already_read(const std::string &key_description) :
		std::logic_error{"Already read: " + key_description} {}

	already_read(const already_read &) = default;
	already_read(already_read &&) = default;
	already_read &operator=(const already_read &) = default;
	already_read &operator=(already_read &&) = default;

	virtual ~already_read() = default;
};

class no_active_context : public std::logic_error {
public:
	no_active_context() :
		std::logic_error{"No current context"} {}

	no_active_context(const no_active_context &) = default;
	no_active_context(no_active_context &&) = default;
	no_active_context &operator=(const no_active_context &) = default;
	no_active_context &operator=(no_active_context &&) = default;

	virtual ~no_active_context() = default;
};

class expired_context : public std::logic_error {
public:
	expired_context() :
		std::logic_error{"Context expired"} {}

	expired_context(const expired_context &) = default;
	expired_context(expired_context &&) = default;
	expired_context &operator=(const expired_context &) = default;
	expired_context &operator=(expired_context &&) = default;

	virtual ~expired_context() = default;
};

class unresolved_cycle : public std::runtime_error {
public:
	unresolved_cycle(const std::string &factory_label,
					 const std::string &key_description) :
		std::runtime_error{"Factory " + factory_label + " didn't resolve " +
						   key_description} {}

	unresolved_cycle(const unresolved_cycle &) = default;
	unresolved_cycle(unresolved_cycle &&) = default;
	unresolved_cycle &operator=(const unresolved_cycle &) = default;
	unresolved_cycle &operator=(unresolved_cycle &&) = default;

	virtual ~unresolved_cycle() = default;
};

class no_configuration : public std::runtime_error {
public:
	explicit no_configuration(const std::string &key_description) :
		std::runtime_error{"No config for " + key_description} {}

	no_configuration(const no_configuration &) = default;
	no_configuration(no_configuration &&) = default;
	no_configuration &operator=(const no_configuration &) = default;
	no_configuration &operator=(no_configuration &&) = default;

	virtual ~no_configuration() = default;
};

class bad_value_cast : public std::runtime_error {
public:
	bad_value_cast(const std::string &held, const std::string &requested) :
		std::runtime_error{"Value of type " + held + " requested as " +
						   requested} {}

	bad_value_cast(const bad_value_cast &) = default;
	bad_value_cast(bad_value_cast &&) = default;
	bad_value_cast &operator=(const bad_value_cast &) = default;
	bad_value_cast &operator=(bad_value_cast &&) = default;

	virtual ~bad_value_cast() = default;
};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_ERRORS_HPP_ */
