/*
 * Shipyard
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "renderer/InlineRenderer.hpp"
#include "renderer/InteractiveRenderer.hpp"
#include "test_utility/RecordingTerminal.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace shipyard {
namespace renderer {
namespace test {

using test_utility::renderer::RecordingTerminal;

namespace {

// interval long enough for the run loop to never tick on its own during a test
const auto noTicks = std::chrono::seconds{60};

template<class Predicate>
bool waitFor(Predicate predicate) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while(!predicate()) {
        if(std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

bool endsWith(const std::vector<std::string>& operations, const std::vector<std::string>& tail) {
    if(operations.size() < tail.size()) {
        return false;
    }
    return std::equal(tail.cbegin(), tail.cend(), operations.cend() - tail.size());
}

// Blocks the events of the "chatty" service in the renderer until opened
class GatedRenderer : public Renderer {
public:
    GatedRenderer(const std::vector<std::string>& services, Terminal& terminal)
        : Renderer{services, terminal}
    {
        startConsumer();
    }
    ~GatedRenderer() {
        open();
        stopConsumer();
    }

    void start() override {}
    void end(const boost::optional<Summary>& = boost::none) override {
        if(markEnded()) {
            finishServices();
        }
    }

    void open() {
        std::lock_guard<std::mutex> lock{gateMutex};
        isOpen = true;
        gate.notify_all();
    }

private:
    void onServiceEvent(const std::string& service, const ServiceStatus&) override {
        if(service != "chatty") {
            return;
        }
        std::unique_lock<std::mutex> lock{gateMutex};
        gate.wait(lock, [this]() { return isOpen; });
    }

private:
    std::mutex gateMutex;
    std::condition_variable gate;
    bool isOpen = false;
};

}

TEST_GROUP(RendererTestGroup) {
};

TEST(RendererTestGroup, fullServiceChannelDoesNotBlockOtherServices) {
    auto terminal = RecordingTerminal{};
    auto renderer = GatedRenderer{{"chatty", "quiet"}, terminal};

    // one event held by the consumer, a full channel and one blocked writer
    std::atomic<bool> isChattyDone{false};
    auto chatty = std::thread{[&renderer, &isChattyDone]() {
        auto stream = renderer.getStream("chatty");
        for(std::size_t i = 0; i < Renderer::eventChannelCapacity + 2; ++i) {
            stream.write(progress::StatusEvent{"Step 1/1 : RUN yes"});
        }
        isChattyDone = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    CHECK(!isChattyDone);

    std::atomic<bool> isQuietSent{false};
    auto quiet = std::thread{[&renderer, &isQuietSent]() {
        renderer.getStream("quiet").write(progress::StatusEvent{"Step 1/2 : FROM alpine"});
        isQuietSent = true;
    }};
    CHECK(waitFor([&isQuietSent]() { return isQuietSent.load(); }));

    renderer.open();
    chatty.join();
    quiet.join();
    CHECK(waitFor([&renderer]() {
        auto status = renderer.getServiceStatus("quiet").status;
        return status && *status == "Step 1/2 : FROM alpine";
    }));
    renderer.end();
}

TEST(RendererTestGroup, inlineRenderer) {
    auto terminal = RecordingTerminal{};
    auto renderer = InlineRenderer{{"main", "db"}, terminal};
    renderer.start();

    renderer.getStream("main").write(progress::StatusEvent{"Step 1/2 : FROM alpine"});
    renderer.getStream("db").write(progress::ErrorEvent{"boom"});
    renderer.getStream("main").write(progress::ProgressEvent{50, "Step 2/2 : RUN make"});
    renderer.getStream("main").write(progress::RawEvent{"{}"});

    renderer.end(Renderer::Summary{{"main", "Image size: 1.05 MB"}, {"db", "boom"}});
    CHECK_EQUAL(terminal.getOutput(), std::string{
        "Building services...\n"
        "main Preparing...\n"
        "db   Preparing...\n"
        "main Step 1/2 : FROM alpine\n"
        "db   boom\n"
        "main Step 2/2 : RUN make\n"
        "main Waiting...\n"
        "main Image size: 1.05 MB\n"
        "db   boom\n"
        "Built 2 services in 0 seconds\n"});
}

TEST(RendererTestGroup, inlineRendererEndsOnce) {
    auto terminal = RecordingTerminal{};
    auto renderer = InlineRenderer{{"main"}, terminal};
    renderer.start();
    renderer.end();
    renderer.end(Renderer::Summary{{"main", "done"}});
    CHECK_EQUAL(terminal.getOutput(), std::string{"Building services...\nmain Preparing...\n"});

    // events after the end are discarded
    renderer.getStream("main").write(progress::StatusEvent{"late"});
    CHECK_EQUAL(terminal.getOutput(), std::string{"Building services...\nmain Preparing...\n"});
}

TEST(RendererTestGroup, unknownService) {
    auto terminal = RecordingTerminal{};
    auto renderer = InlineRenderer{{"main"}, terminal};
    CHECK_THROWS(libshipyard::Error, renderer.getStream("frontend"));
}

TEST(RendererTestGroup, servicePhases) {
    auto terminal = RecordingTerminal{};
    auto renderer = InlineRenderer{{"main", "db"}, terminal};
    CHECK(renderer.getServiceStatus("main").phase == ServicePhase::Preparing);
    renderer.start();
    CHECK(renderer.getServiceStatus("main").phase == ServicePhase::Preparing);
    CHECK_EQUAL(*renderer.getServiceStatus("main").status, std::string{"Preparing..."});

    renderer.getStream("main").write(progress::StatusEvent{"Step 1/2 : FROM alpine"});
    renderer.getStream("db").write(progress::ErrorEvent{"boom"});
    CHECK(waitFor([&renderer]() { return renderer.getServiceStatus("db").phase == ServicePhase::Done; }));
    CHECK(waitFor([&renderer]() { return renderer.getServiceStatus("main").phase == ServicePhase::Running; }));
    CHECK(!renderer.getServiceStatus("db").status);

    renderer.end();
    CHECK(renderer.getServiceStatus("main").phase == ServicePhase::Done);
}

TEST(RendererTestGroup, interactiveRenderer) {
    auto terminal = RecordingTerminal{200};
    auto renderer = InteractiveRenderer{{"main"}, terminal, [](int) {}, noTicks};
    renderer.start();
    CHECK(terminal.contains("hideCursor"));

    renderer.getStream("main").write(progress::ProgressEvent{50, "Step 1/2 : FROM alpine"});
    CHECK(waitFor([&renderer]() { return static_cast<bool>(renderer.getServiceStatus("main").progress); }));

    renderer.display();
    CHECK(endsWith(terminal.getOperations(), {
        "deleteToEnd",
        "clearLine",
        "write:[Build]   ",
        "writeLine:Building services... |",
        "clearLine",
        "writeLine:[Build]   main [==========>          ]  50% Step 1/2 : FROM alpine",
        "cursorUp:2"}));

    renderer.end();
    CHECK(endsWith(terminal.getOperations(), {
        "deleteToEnd",
        "clearLine",
        "write:[Build]   ",
        "writeLine:Built 1 service in 0 seconds",
        "clearLine",
        "writeLine:[Build]   main [==========>          ]  50% Step 1/2 : FROM alpine",
        "showCursor"}));
}

TEST(RendererTestGroup, interactiveRendererSummary) {
    auto terminal = RecordingTerminal{200};
    auto renderer = InteractiveRenderer{{"main", "database"}, terminal, [](int) {}, noTicks};
    renderer.start();
    renderer.getStream("database").write(progress::RawEvent{"{}"});
    renderer.end(Renderer::Summary{{"main", "Image size: 1.05 MB"}});

    // service names are padded to the longest one
    CHECK(endsWith(terminal.getOperations(), {
        "writeLine:Built 2 services in 0 seconds",
        "clearLine",
        "writeLine:[Build]   main     Image size: 1.05 MB",
        "clearLine",
        "writeLine:[Build]   database Waiting...",
        "showCursor"}));
}

TEST(RendererTestGroup, interactiveRendererNeverStarted) {
    auto terminal = RecordingTerminal{200};
    auto renderer = InteractiveRenderer{{"main"}, terminal, [](int) {}, noTicks};
    renderer.end();
    CHECK(terminal.contains("writeLine:Built 1 service in unknown time"));
    CHECK(terminal.contains("writeLine:[Build]   main Waiting..."));
}

TEST(RendererTestGroup, interactiveRendererTruncatesLines) {
    auto terminal = RecordingTerminal{20};
    auto renderer = InteractiveRenderer{{"main"}, terminal, [](int) {}, noTicks};
    renderer.start();
    renderer.display();
    CHECK(terminal.contains("writeLine:[Build]   main Prep…"));
    renderer.end();
}

TEST(RendererTestGroup, interactiveRendererTicks) {
    auto terminal = RecordingTerminal{200};
    auto renderer = InteractiveRenderer{{"main"}, terminal, [](int) {}, std::chrono::milliseconds{5}};
    renderer.start();
    CHECK(waitFor([&terminal]() { return terminal.contains("writeLine:Building services... /"); }));
    renderer.end();
    CHECK_EQUAL(terminal.getOperations().back(), std::string{"showCursor"});
}

TEST(RendererTestGroup, interactiveRendererInterrupted) {
    auto exitStatus = std::atomic<int>{-1};
    auto terminal = RecordingTerminal{200};
    auto renderer = InteractiveRenderer{{"main"}, terminal, [&exitStatus](int status) { exitStatus = status; }, noTicks};
    renderer.start();

    raise(SIGINT);
    CHECK(waitFor([&exitStatus]() { return exitStatus != -1; }));
    CHECK_EQUAL(exitStatus.load(), 130);
    CHECK(terminal.contains("writeLine:Build cancelled"));
    CHECK_EQUAL(terminal.getOperations().back(), std::string{"showCursor"});

    // ending again renders nothing
    auto operationCount = terminal.getOperations().size();
    renderer.end();
    CHECK_EQUAL(terminal.getOperations().size(), operationCount);
}

TEST(RendererTestGroup, interruptExitsWithoutRunningExitHandlers) {
    auto pid = fork();
    CHECK(pid != -1);
    if(pid == 0) {
        // an exit handler would change the exit status
        std::atexit([]() { _exit(1); });
        auto terminal = RecordingTerminal{200};
        auto renderer = InteractiveRenderer{{"main"}, terminal, InteractiveRenderer::defaultExitFunction(), noTicks};
        renderer.start();
        raise(SIGINT);
        std::this_thread::sleep_for(std::chrono::seconds{5});
        _exit(0);
    }

    auto status = int{};
    CHECK_EQUAL(waitpid(pid, &status, 0), pid);
    CHECK(WIFEXITED(status));
    CHECK_EQUAL(WEXITSTATUS(status), InteractiveRenderer::cancelledExitStatus);
}

}}}

SHIPYARD_UNITTEST_MAIN_FUNCTION();
