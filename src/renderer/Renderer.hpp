/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef shipyard_renderer_Renderer_hpp
#define shipyard_renderer_Renderer_hpp

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libshipyard/LogLevel.hpp"
#include "progress/Channel.hpp"
#include "progress/Event.hpp"
#include "renderer/Terminal.hpp"


namespace shipyard {
namespace renderer {

enum class ServicePhase { Preparing, Running, Done };

// What the renderer currently shows for a service. Each event replaces it entirely.
struct ServiceStatus {
    boost::optional<std::string> status;
    boost::optional<int> progress;
    boost::optional<std::string> error;
    ServicePhase phase = ServicePhase::Preparing;
};

using EventChannel = progress::Channel<progress::ServiceEvent>;

// Wakes up the consumer of the service channels
class EventSignal {
public:
    std::uint64_t current() const;
    void notify();
    // Returns once notify() was called after the generation was seen
    void wait(std::uint64_t seen);

private:
    mutable std::mutex mutex;
    std::condition_variable changed;
    std::uint64_t generation = 0;
};

/**
 * Write end of the event channel of one service.
 * Events written after the renderer ended are discarded.
 */
class ServiceStream {
public:
    ServiceStream(std::shared_ptr<EventChannel> channel, std::shared_ptr<EventSignal> signal,
                  const std::string& service);
    void write(const progress::Event& event) const;
    const std::string& getService() const;

private:
    std::shared_ptr<EventChannel> channel;
    std::shared_ptr<EventSignal> signal;
    std::string service;
};

/**
 * Base of the build progress renderers. Each service writes its events into its own
 * bounded channel. One consumer thread takes an event of each service in turn,
 * so a service that floods its channel only blocks its own writers. The state of
 * a service is only ever touched under the renderer's lock.
 *
 * Derived classes must call startConsumer() at the end of their constructor and
 * stopConsumer() in their destructor.
 */
class Renderer {
public:
    using Summary = std::map<std::string, std::string>;

public:
    Renderer(const std::vector<std::string>& services, Terminal& terminal);
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;
    virtual ~Renderer();

    virtual void start() = 0;
    // Idempotent. The summary replaces the per-service status in the final rendering.
    virtual void end(const boost::optional<Summary>& summary = boost::none) = 0;

    ServiceStream getStream(const std::string& service) const;
    const std::vector<std::string>& getServices() const;
    ServiceStatus getServiceStatus(const std::string& service) const;

public:
    static constexpr std::size_t eventChannelCapacity = 1024;

protected:
    void startConsumer();
    // Applies the events still queued, then stops the consumer
    void stopConsumer();
    // Called under the lock after the state of the service was updated
    virtual void onServiceEvent(const std::string& service, const ServiceStatus& status);
    // Shows every service as "Preparing...", to be called under the lock
    void setPreparing();
    bool markEnded();
    // Stops the consumer and moves every service to the done phase
    void finishServices();
    std::string formatBuiltStatus() const;
    // Text shown for a service: the error, the progress bar and status, the status or "Waiting..."
    std::string getSummaryText(const ServiceStatus& status, bool withProgressBar) const;
    std::size_t getLongestServiceName() const;
    void printLog(const boost::format& message, libshipyard::LogLevel level,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;

private:
    void consume();
    void apply(const progress::ServiceEvent& event);

protected:
    const std::vector<std::string> services;
    Terminal& terminal;
    mutable std::mutex mutex;
    std::map<std::string, ServiceStatus> states;
    boost::optional<std::chrono::steady_clock::time_point> startTime;

private:
    const std::string sysname = "Renderer";
    std::map<std::string, std::shared_ptr<EventChannel>> channels;
    std::shared_ptr<EventSignal> signal;
    std::atomic<bool> isStopping{false};
    std::thread consumer;
    bool isEnded = false;
};

}
}

#endif
