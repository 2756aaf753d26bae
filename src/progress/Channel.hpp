/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_progress_Channel_hpp
#define shipyard_progress_Channel_hpp

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include <boost/optional.hpp>

#include "libshipyard/Error.hpp"


namespace shipyard {
namespace progress {

/**
 * Bounded multi-producer queue. Senders block while the channel is full,
 * receivers block while it is empty. Once closed, the remaining items can
 * still be received while further sends are rejected.
 */
template<class T>
class Channel {
public:
    explicit Channel(std::size_t capacity)
        : capacity{capacity}
    {
        if(capacity == 0) {
            SHIPYARD_THROW_ERROR("The capacity of a channel must be greater than zero");
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // returns false if the channel is closed
    bool send(T item) {
        std::unique_lock<std::mutex> lock{mutex};
        notFull.wait(lock, [this]() { return isClosed || items.size() < capacity; });
        if(isClosed) {
            return false;
        }
        items.push_back(std::move(item));
        notEmpty.notify_one();
        return true;
    }

    // returns none once the channel is closed and drained
    boost::optional<T> receive() {
        std::unique_lock<std::mutex> lock{mutex};
        notEmpty.wait(lock, [this]() { return isClosed || !items.empty(); });
        return pop();
    }

    boost::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock{mutex};
        return pop();
    }

    void close() {
        std::lock_guard<std::mutex> lock{mutex};
        isClosed = true;
        notEmpty.notify_all();
        notFull.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock{mutex};
        return isClosed;
    }

private:
    boost::optional<T> pop() {
        if(items.empty()) {
            return boost::none;
        }
        auto item = std::move(items.front());
        items.pop_front();
        notFull.notify_one();
        return boost::optional<T>{ std::move(item) };
    }

private:
    const std::size_t capacity;
    std::deque<T> items;
    bool isClosed = false;
    mutable std::mutex mutex;
    std::condition_variable notFull;
    std::condition_variable notEmpty;
};

}
}

#endif
