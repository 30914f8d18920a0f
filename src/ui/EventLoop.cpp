#include "ui/EventLoop.h"

#include <FL/Fl.H>

#include <exception>
#include <memory>
#include <unordered_set>

#include "utils/Logger.h"

namespace EventLoop {

namespace {

void runTask(void *data) {
    std::unique_ptr<Task> task(static_cast<Task *>(data));
    if (!task || !*task) {
        return;
    }
    try {
        (*task)();
    } catch (const std::exception &e) {
        Logger::error(std::string("Event loop task failed: ") + e.what());
    }
}

// Delayed tasks not yet run, owned here until they fire or are cancelled.
std::unordered_set<Task *> &pendingDelayed() {
    static std::unordered_set<Task *> tasks;
    return tasks;
}

void runDelayed(void *data) {
    pendingDelayed().erase(static_cast<Task *>(data));
    runTask(data);
}

} // namespace

void post(Task task) {
    auto *heapTask = new Task(std::move(task));
    if (Fl::awake(runTask, heapTask) != 0) {
        Logger::error("Event loop queue is full, task dropped");
        delete heapTask;
    }
}

void postDelayed(double seconds, Task task) {
    auto *heapTask = new Task(std::move(task));
    pendingDelayed().insert(heapTask);
    Fl::add_timeout(seconds, runDelayed, heapTask);
}

size_t cancelDelayed() {
    std::unordered_set<Task *> tasks;
    tasks.swap(pendingDelayed());
    for (Task *task : tasks) {
        Fl::remove_timeout(runDelayed, task);
        delete task;
    }
    return tasks.size();
}

} // namespace EventLoop
