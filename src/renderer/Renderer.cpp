/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Renderer.hpp"

#include <algorithm>

#include "libshipyard/Error.hpp"
#include "libshipyard/Logger.hpp"
#include "libshipyard/Utility.hpp"
#include "renderer/Formatting.hpp"


namespace shipyard {
namespace renderer {

constexpr std::size_t Renderer::eventChannelCapacity;

std::uint64_t EventSignal::current() const {
    std::lock_guard<std::mutex> lock{mutex};
    return generation;
}

void EventSignal::notify() {
    std::lock_guard<std::mutex> lock{mutex};
    ++generation;
    changed.notify_all();
}

void EventSignal::wait(std::uint64_t seen) {
    std::unique_lock<std::mutex> lock{mutex};
    changed.wait(lock, [this, seen]() { return generation != seen; });
}

ServiceStream::ServiceStream(std::shared_ptr<EventChannel> channel, std::shared_ptr<EventSignal> signal,
                             const std::string& service)
    : channel{std::move(channel)}
    , signal{std::move(signal)}
    , service{service}
{}

void ServiceStream::write(const progress::Event& event) const {
    if(channel->send(progress::ServiceEvent{service, event})) {
        signal->notify();
    }
    else {
        libshipyard::logMessage(boost::format("Discarded progress event of service %s: renderer already ended")
                                % service,
                                libshipyard::LogLevel::DEBUG);
    }
}

const std::string& ServiceStream::getService() const {
    return service;
}

Renderer::Renderer(const std::vector<std::string>& services, Terminal& terminal)
    : services{services}
    , terminal(terminal)
    , signal{std::make_shared<EventSignal>()}
{
    for(const auto& service : services) {
        states[service] = ServiceStatus{};
        channels[service] = std::make_shared<EventChannel>(eventChannelCapacity);
    }
}

Renderer::~Renderer() {
    stopConsumer();
}

ServiceStream Renderer::getStream(const std::string& service) const {
    auto it = channels.find(service);
    if(it == channels.cend()) {
        auto message = boost::format("Cannot render progress of unknown service '%s'") % service;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return ServiceStream{it->second, signal, service};
}

const std::vector<std::string>& Renderer::getServices() const {
    return services;
}

ServiceStatus Renderer::getServiceStatus(const std::string& service) const {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = states.find(service);
    if(it == states.cend()) {
        auto message = boost::format("Cannot render progress of unknown service '%s'") % service;
        SHIPYARD_THROW_ERROR(message.str());
    }
    return it->second;
}

void Renderer::startConsumer() {
    consumer = std::thread{&Renderer::consume, this};
}

void Renderer::stopConsumer() {
    for(auto& channel : channels) {
        channel.second->close();
    }
    isStopping = true;
    signal->notify();
    if(consumer.joinable()) {
        consumer.join();
    }
}

void Renderer::consume() {
    while(true) {
        // read before the scan: once stopping, the channels are closed and an empty scan means drained
        auto stopping = isStopping.load();
        auto seen = signal->current();

        auto isReceived = false;
        for(auto& channel : channels) {
            if(auto event = channel.second->tryReceive()) {
                apply(*event);
                isReceived = true;
            }
        }

        if(isReceived) {
            continue;
        }
        if(stopping) {
            return;
        }
        signal->wait(seen);
    }
}

namespace {

class StatusUpdater : public boost::static_visitor<ServiceStatus> {
public:
    ServiceStatus operator()(const progress::ErrorEvent& event) const {
        auto status = ServiceStatus{};
        status.error = event.message;
        status.phase = ServicePhase::Done;
        return status;
    }
    ServiceStatus operator()(const progress::ProgressEvent& event) const {
        auto status = ServiceStatus{};
        status.progress = event.progress;
        status.status = event.status;
        status.phase = ServicePhase::Running;
        return status;
    }
    ServiceStatus operator()(const progress::StatusEvent& event) const {
        auto status = ServiceStatus{};
        status.status = event.status;
        status.phase = ServicePhase::Running;
        return status;
    }
    ServiceStatus operator()(const progress::RawEvent&) const {
        auto status = ServiceStatus{};
        status.phase = ServicePhase::Running;
        return status;
    }
};

}

void Renderer::apply(const progress::ServiceEvent& event) {
    std::lock_guard<std::mutex> lock{mutex};
    auto it = states.find(event.service);
    if(it == states.end()) {
        printLog(boost::format("Ignoring progress event of unknown service %s") % event.service,
                 libshipyard::LogLevel::DEBUG);
        return;
    }
    it->second = boost::apply_visitor(StatusUpdater{}, event.event);
    onServiceEvent(event.service, it->second);
}

void Renderer::onServiceEvent(const std::string&, const ServiceStatus&) {}

void Renderer::setPreparing() {
    for(auto& state : states) {
        state.second = ServiceStatus{};
        state.second.status = std::string{"Preparing..."};
    }
}

bool Renderer::markEnded() {
    std::lock_guard<std::mutex> lock{mutex};
    if(isEnded) {
        return false;
    }
    isEnded = true;
    return true;
}

void Renderer::finishServices() {
    stopConsumer();
    std::lock_guard<std::mutex> lock{mutex};
    for(auto& state : states) {
        state.second.phase = ServicePhase::Done;
    }
}

std::string Renderer::formatBuiltStatus() const {
    auto serviceString = services.size() == 1
        ? std::string{"1 service"}
        : (boost::format("%d services") % services.size()).str();
    auto durationString = startTime
        ? formatDuration(std::chrono::steady_clock::now() - *startTime)
        : std::string{"unknown time"};
    return "Built " + serviceString + " in " + durationString;
}

std::string Renderer::getSummaryText(const ServiceStatus& status, bool withProgressBar) const {
    if(status.error) {
        return *status.error;
    }
    if(withProgressBar && status.progress && *status.progress != 0) {
        auto bar = renderProgressBar(*status.progress, 20);
        return status.status ? bar + " " + *status.status : bar;
    }
    if(status.status) {
        return *status.status;
    }
    return "Waiting...";
}

std::size_t Renderer::getLongestServiceName() const {
    auto longest = std::size_t{0};
    for(const auto& service : services) {
        longest = std::max(longest, service.size());
    }
    return longest;
}

void Renderer::printLog(const boost::format& message, libshipyard::LogLevel level,
                        std::ostream& outStream, std::ostream& errStream) const {
    libshipyard::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
