#include "sandbox/slot_pool.hpp"
#include <glog/logging.h>
#include <boost/asio/post.hpp>

namespace arbiter {
using namespace std;

slot_pool::slot::slot() : pool(nullptr) {}

slot_pool::slot::slot(slot_pool *pool) : pool(pool) {}

slot_pool::slot::slot(slot &&other) : pool(other.pool) {
    other.pool = nullptr;
}

slot_pool::slot::~slot() {
    release();
}

slot_pool::slot &slot_pool::slot::operator=(slot &&other) {
    if (this != &other) {
        release();
        pool = other.pool;
        other.pool = nullptr;
    }
    return *this;
}

slot_pool::slot::operator bool() const {
    return pool != nullptr;
}

void slot_pool::slot::release() {
    if (!pool) return;
    slot_pool *owner = pool;
    pool = nullptr;
    owner->give_back();
}

slot_pool::slot_pool(boost::asio::io_context &ioc, size_t capacity)
    : ioc(ioc), cap(capacity == 0 ? 1 : capacity) {}

void slot_pool::async_acquire(function<void(slot)> handler) {
    if (used < cap) {
        ++used;
        boost::asio::post(ioc, [handler = move(handler), s = slot(this)]() mutable {
            handler(move(s));
        });
    } else {
        DLOG(INFO) << "Sandbox pool exhausted, " << waiters.size() + 1 << " requests waiting";
        waiters.push_back(move(handler));
    }
}

void slot_pool::give_back() {
    if (!waiters.empty()) {
        // 名额直接转交给排在最前面的请求，used 不变
        auto handler = move(waiters.front());
        waiters.pop_front();
        boost::asio::post(ioc, [handler = move(handler), s = slot(this)]() mutable {
            handler(move(s));
        });
    } else {
        --used;
    }
}

size_t slot_pool::capacity() const {
    return cap;
}

size_t slot_pool::in_use() const {
    return used;
}

size_t slot_pool::waiting() const {
    return waiters.size();
}

}  // namespace arbiter
