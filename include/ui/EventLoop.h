#pragma once

#include <cstddef>
#include <functional>

/**
 * Schedules work on the FLTK event loop, the only thread that touches state and widgets.
 */
namespace EventLoop {

using Task = std::function<void()>;

/**
 * @brief Run a task on the UI thread at the next loop iteration; callable from any thread
 * Requires Fl::lock() to have been called once at startup.
 */
void post(Task task);

/**
 * @brief Run a task on the UI thread after a delay; UI thread only
 */
void postDelayed(double seconds, Task task);

/**
 * @brief Drop every delayed task that has not run yet; call on shutdown
 * @return Number of tasks dropped
 */
size_t cancelDelayed();

} // namespace EventLoop
