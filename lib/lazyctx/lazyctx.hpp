/*
 * lazyctx.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_LAZYCTX_HPP_
#define LIB_LAZYCTX_LAZYCTX_HPP_

#include <lazyctx/context.hpp>
#include <lazyctx/errors.hpp>
#include <lazyctx/global.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/lazy_ptr.hpp>
#include <lazyctx/policy.hpp>
#include <lazyctx/value.hpp>

#endif /* LIB_LAZYCTX_LAZYCTX_HPP_ */
