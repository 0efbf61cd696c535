#include "task_agg/thread_group.hpp"

namespace task_agg {

ThreadGroup::~ThreadGroup() {
    JoinAll();
}

void ThreadGroup::JoinAll() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

}
