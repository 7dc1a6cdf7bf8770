/*
 * ambient.hpp
 *
 *  Created on: Oct 18, 2026
 *      Author: lazyctx contributors
 */

#ifndef LIB_LAZYCTX_AMBIENT_HPP_
#define LIB_LAZYCTX_AMBIENT_HPP_

#include <lazyctx/defs.hpp>
#include <lazyctx/entry.hpp>
#include <lazyctx/key.hpp>
#include <lazyctx/utils.hpp>

namespace lazyctx {

// The registry whose factory is running on this thread, and the log that
// collects the keys that factory reads. Only execute() changes it, and the
// previous frame is back in place on every exit path.
class ambient {
public:
	ambient() = delete;

	static const registry_ptr &active() { return current_frame().active; }

	static bool is_active(const registry *r) {
		return (nullptr != r) && (current_frame().active.get() == r);
	}

	// Appends k if the running factory belongs to r and is being tracked.
	static void record(const registry *r, const key &k) {
		frame &f = current_frame();
		if ((nullptr != f.log) && (f.active.get() == r))
			f.log->push_back(k);
	}

	template <typename functor>
	static auto execute(const registry_ptr &r, key_log *log, functor f)
		-> decltype(f()) {
		frame saved = current_frame();
		current_frame() = frame{r, log};
		defer restore{[saved]() { current_frame() = saved; }};
		return f();
	}

private:
	struct frame {
		registry_ptr active;
		key_log *log = nullptr;
	};

	static frame &current_frame() {
		thread_local frame f;
		return f;
	}
};

} // namespace lazyctx

#endif /* LIB_LAZYCTX_AMBIENT_HPP_ */
