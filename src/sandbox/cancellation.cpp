#include "sandbox/cancellation.hpp"

namespace arbiter {
using namespace std;

void cancellation::cancel() {
    if (flag) return;
    flag = true;
    auto pending = move(callbacks);
    callbacks.clear();
    for (auto &[id, cb] : pending)
        cb();
}

bool cancellation::cancelled() const {
    return flag;
}

size_t cancellation::subscribe(callback cb) {
    size_t id = next_id++;
    if (!flag) callbacks.emplace(id, move(cb));
    return id;
}

void cancellation::unsubscribe(size_t id) {
    callbacks.erase(id);
}

}  // namespace arbiter
