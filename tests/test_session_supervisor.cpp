#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "pipeline/ChannelCoordinator.hpp"
#include "pipeline/SessionSupervisor.hpp"
#include "Fakes.hpp"
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

namespace {

AppConfig testConfig() {
    AppConfig c;
    c.service.apiKey = "sk-test";
    c.service.connectTimeoutMs = 500;
    c.service.closeTimeoutMs = 1000;
    c.audio.stopTimeoutMs = 1000;
    return c;
}

ChannelConfig micChannel(const std::string& target = "en") {
    ChannelConfig c;
    c.name = "mic";
    c.targetLang = target;
    c.sourceType = SourceType::Microphone;
    return c;
}

ChannelConfig systemChannel(const std::string& target = "en") {
    ChannelConfig c;
    c.name = "system";
    c.targetLang = target;
    c.sourceType = SourceType::SystemLoopback;
    return c;
}

std::string translationDone(const std::string& text) {
    return R"({"type":"response.text.done","text":")" + text + R"("})";
}

// Tagged results from every channel
struct TaggedLog {
    std::mutex mtx;
    std::vector<std::pair<std::string, std::string>> entries;   // channel, translation

    ChannelResultCallback sink() {
        return [this](const std::string& channel, const TranslationResult& r) {
            std::lock_guard lock(mtx);
            entries.emplace_back(channel, r.translatedText);
        };
    }

    size_t size() {
        std::lock_guard lock(mtx);
        return entries.size();
    }

    std::vector<std::string> textsFor(const std::string& channel) {
        std::lock_guard lock(mtx);
        std::vector<std::string> out;
        for (auto& [ch, text] : entries)
            if (ch == channel) out.push_back(text);
        return out;
    }
};

} // namespace

// ── ChannelCoordinator ──────────────────────────────────────────────────

TEST(ChannelCoordinator, StartStreamsCapturedAudio) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel(), testConfig(), backend, hub.factory());

    channel.start([](const TranslationResult&) {});
    EXPECT_TRUE(channel.isRunning());
    ASSERT_TRUE(channel.device().has_value());
    EXPECT_EQ(channel.device()->displayName, "Microphone (USB)");

    auto link = hub.link(0);
    EXPECT_TRUE(waitFor([&] { return link->countSent("input_audio_buffer.append") >= 2; }));

    channel.stop();
    EXPECT_FALSE(channel.isRunning());
    EXPECT_TRUE(link->isClosed());
    EXPECT_EQ(backend->closes->load(), 1);
    EXPECT_FALSE(channel.device().has_value());
}

TEST(ChannelCoordinator, StopIsIdempotent) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel(), testConfig(), backend, hub.factory());

    EXPECT_NO_THROW(channel.stop());
    channel.start([](const TranslationResult&) {});
    EXPECT_NO_THROW(channel.stop());
    EXPECT_NO_THROW(channel.stop());
    EXPECT_EQ(backend->closes->load(), 1);
}

TEST(ChannelCoordinator, AudioFailureStopsTheSession) {
    auto backend = makeDesktopBackend();
    backend->openFails = true;
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel(), testConfig(), backend, hub.factory());

    EXPECT_THROW(channel.start([](const TranslationResult&) {}), DeviceOpenError);
    EXPECT_FALSE(channel.isRunning());
    ASSERT_EQ(hub.count(), 1u);
    EXPECT_TRUE(hub.link(0)->isClosed());
}

TEST(ChannelCoordinator, ConnectionFailureNeverOpensCapture) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.refuse = true; };
    ChannelCoordinator channel(micChannel(), testConfig(), backend, hub.factory());

    EXPECT_THROW(channel.start([](const TranslationResult&) {}), ConnectionError);
    EXPECT_EQ(backend->opens.load(), 0);
    EXPECT_FALSE(channel.isRunning());
}

TEST(ChannelCoordinator, SwitchLanguageKeepsCaptureRunning) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel("en"), testConfig(), backend, hub.factory());

    channel.start([](const TranslationResult&) {});
    channel.switchLanguage("de");

    EXPECT_EQ(channel.targetLang(), "de");
    EXPECT_TRUE(channel.isRunning());
    EXPECT_EQ(backend->opens.load(), 1);
    ASSERT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.link(0)->isClosed());

    auto second = hub.link(1);
    EXPECT_NE(second->sentMessages().at(0).find(R"("language":"de")"), std::string::npos);
    EXPECT_TRUE(waitFor([&] { return second->countSent("input_audio_buffer.append") >= 1; }));

    channel.stop();
}

TEST(ChannelCoordinator, SwitchLanguageWhileStoppedAppliesOnStart) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel("en"), testConfig(), backend, hub.factory());

    channel.switchLanguage("zh");
    EXPECT_EQ(hub.count(), 0u);

    channel.start([](const TranslationResult&) {});
    EXPECT_NE(hub.link(0)->sentMessages().at(0).find(R"("language":"zh")"),
              std::string::npos);
    channel.stop();
}

TEST(ChannelCoordinator, StopDuringLanguageSwitchLeavesChannelStopped) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    ChannelCoordinator channel(micChannel("en"), testConfig(), backend, hub.factory());

    channel.start([](const TranslationResult&) {});
    hub.configure = [&](FakeLink&) {
        std::thread([&] { channel.stop(); }).join();
    };

    EXPECT_NO_THROW(channel.switchLanguage("fr"));
    EXPECT_FALSE(channel.isRunning());
    EXPECT_NE(channel.sessionState(), StreamingSession::State::Streaming);
    ASSERT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(backend->closes->load(), 1);
    hub.configure = nullptr;
}

TEST(ChannelCoordinator, StopReportsSessionCloseFailure) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.failClose = true; };
    ChannelCoordinator channel(micChannel(), testConfig(), backend, hub.factory());

    channel.start([](const TranslationResult&) {});
    EXPECT_THROW(channel.stop(), ConnectionError);
    EXPECT_FALSE(channel.isRunning());
    EXPECT_EQ(backend->closes->load(), 1);
    EXPECT_NO_THROW(channel.stop());
}

// ── SessionSupervisor ───────────────────────────────────────────────────

TEST(SessionSupervisor, DuplicateChannelNameRejected) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());

    supervisor.addChannel(micChannel());
    EXPECT_THROW(supervisor.addChannel(micChannel("fr")), DuplicateChannelName);
    EXPECT_EQ(supervisor.channelNames(), std::vector<std::string>{"mic"});
}

TEST(SessionSupervisor, UnknownChannelRejected) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    supervisor.addChannel(micChannel());

    EXPECT_THROW(supervisor.switchLanguage("speakers", "fr"), UnknownChannel);
}

TEST(SessionSupervisor, MissingCredentialRejectedAtAdd) {
    unsetenv("DASHSCOPE_API_KEY");
    AppConfig c = testConfig();
    c.service.apiKey.clear();
    FakeTransportHub hub;
    SessionSupervisor supervisor(c, makeDesktopBackend(), hub.factory());

    EXPECT_THROW(supervisor.addChannel(micChannel()), MissingCredential);
    EXPECT_TRUE(supervisor.channelNames().empty());
}

TEST(SessionSupervisor, StartIsIdempotent) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());

    supervisor.start();
    supervisor.start();
    EXPECT_TRUE(supervisor.isRunning());
    EXPECT_EQ(hub.count(), 2u);

    supervisor.stop();
    EXPECT_FALSE(supervisor.isRunning());
}

TEST(SessionSupervisor, ResultsAreTaggedWithTheirChannel) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    TaggedLog log;
    supervisor.setResultSink(log.sink());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());
    supervisor.start();

    auto mic = hub.link(0);
    auto system = hub.link(1);
    for (int i = 0; i < 5; i++) {
        mic->push(translationDone("mic-" + std::to_string(i)));
        system->push(translationDone("sys-" + std::to_string(i)));
    }

    ASSERT_TRUE(waitFor([&] { return log.size() == 10; }));
    std::vector<std::string> expectMic, expectSys;
    for (int i = 0; i < 5; i++) {
        expectMic.push_back("mic-" + std::to_string(i));
        expectSys.push_back("sys-" + std::to_string(i));
    }
    EXPECT_EQ(log.textsFor("mic"), expectMic);
    EXPECT_EQ(log.textsFor("system"), expectSys);

    supervisor.stop();
}

TEST(SessionSupervisor, SwitchLanguageTouchesOnlyOneChannel) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    supervisor.addChannel(micChannel("en"));
    supervisor.addChannel(systemChannel("en"));
    supervisor.start();

    supervisor.switchLanguage("system", "ja");
    ASSERT_EQ(hub.count(), 3u);
    EXPECT_FALSE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());

    auto status = supervisor.status();
    ASSERT_EQ(status.size(), 2u);
    EXPECT_EQ(status[0].targetLang, "en");
    EXPECT_EQ(status[1].targetLang, "ja");
    EXPECT_TRUE(status[0].running);
    EXPECT_TRUE(status[1].running);

    supervisor.stop();
}

TEST(SessionSupervisor, FailedStartRollsBackStartedChannels) {
    auto backend = makeDesktopBackend();
    backend->loopbacks = {makeDevice(8, "Headphones [Loopback]", 2, 44100, true)};
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), backend, hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());

    EXPECT_THROW(supervisor.start(), DeviceNotFound);
    EXPECT_FALSE(supervisor.isRunning());
    ASSERT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(backend->closes->load(), 1);

    for (auto& s : supervisor.status())
        EXPECT_FALSE(s.running) << s.name;
}

TEST(SessionSupervisor, ChannelAddedWhileRunningStartsImmediately) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.start();

    supervisor.addChannel(systemChannel());
    EXPECT_EQ(hub.count(), 2u);
    auto status = supervisor.status();
    ASSERT_EQ(status.size(), 2u);
    EXPECT_TRUE(status[1].running);
    EXPECT_EQ(status[1].deviceName, "Speakers (Realtek) [Loopback]");

    supervisor.stop();
}

TEST(SessionSupervisor, StopIsIdempotentAndClosesEverything) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), backend, hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());

    EXPECT_NO_THROW(supervisor.stop());
    supervisor.start();
    EXPECT_NO_THROW(supervisor.stop());
    EXPECT_NO_THROW(supervisor.stop());

    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(backend->closes->load(), 2);
}

TEST(SessionSupervisor, StopCancelsStartWaitingForConnection) {
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.silent = true; };
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());

    std::thread starter([&] { EXPECT_NO_THROW(supervisor.start()); });
    ASSERT_TRUE(waitFor([&] { return hub.count() == 1; }));
    ASSERT_TRUE(waitFor([&] {
        return supervisor.status().at(0).state == StreamingSession::State::Connecting;
    }));

    auto began = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(supervisor.stop());
    starter.join();
    auto took = std::chrono::steady_clock::now() - began;

    // well inside the connect timeout plus configure grace
    EXPECT_LT(took, std::chrono::milliseconds(2000));
    EXPECT_FALSE(supervisor.isRunning());
    EXPECT_EQ(hub.count(), 1u);
    EXPECT_TRUE(hub.link(0)->isClosed());
    for (auto& st : supervisor.status())
        EXPECT_FALSE(st.running) << st.name;
}

TEST(SessionSupervisor, StopWhileSecondChannelConnectsStopsBoth) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), backend, hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());

    int created = 0;
    hub.configure = [&](FakeLink&) {
        if (++created != 2) return;
        std::thread([&] { EXPECT_NO_THROW(supervisor.stop()); }).join();
    };

    EXPECT_NO_THROW(supervisor.start());
    EXPECT_FALSE(supervisor.isRunning());
    ASSERT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(backend->closes->load(), 1);
    for (auto& st : supervisor.status())
        EXPECT_FALSE(st.running) << st.name;

    // a later start is not blocked by the cancelled one
    hub.configure = nullptr;
    supervisor.start();
    EXPECT_TRUE(supervisor.isRunning());
    EXPECT_EQ(hub.count(), 4u);
    supervisor.stop();
}

TEST(SessionSupervisor, StopContinuesPastFailingChannel) {
    auto backend = makeDesktopBackend();
    FakeTransportHub hub;
    int created = 0;
    hub.configure = [&](FakeLink& l) { l.failClose = (++created == 1); };
    SessionSupervisor supervisor(testConfig(), backend, hub.factory());
    supervisor.addChannel(micChannel());
    supervisor.addChannel(systemChannel());
    supervisor.start();

    try {
        supervisor.stop();
        FAIL() << "expected ShutdownError";
    } catch (const ShutdownError& e) {
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_EQ(e.failures()[0].first, "mic");
        EXPECT_NE(e.failures()[0].second.find("socket shutdown failed"), std::string::npos);
    }

    EXPECT_FALSE(supervisor.isRunning());
    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(backend->closes->load(), 2);
    for (auto& st : supervisor.status())
        EXPECT_FALSE(st.running) << st.name;

    EXPECT_NO_THROW(supervisor.stop());
}

TEST(SessionSupervisor, EnumerateDevicesUsesBackend) {
    FakeTransportHub hub;
    SessionSupervisor supervisor(testConfig(), makeDesktopBackend(), hub.factory());

    auto devices = supervisor.enumerateDevices();
    EXPECT_EQ(devices.size(), 3u);
}

TEST(ShutdownError, ListsEveryFailure) {
    ShutdownError err({{"mic", "device busy"}, {"system", "socket stuck"}});
    EXPECT_EQ(err.failures().size(), 2u);
    EXPECT_STREQ(err.what(),
                 "Failed to stop 2 channel(s): [mic: device busy] [system: socket stuck]");
}
