#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "session/StreamingSession.hpp"
#include "Fakes.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <mutex>
#include <thread>

namespace {

AppConfig testConfig() {
    AppConfig c;
    c.service.apiKey = "sk-test";
    c.service.connectTimeoutMs = 500;
    c.service.closeTimeoutMs = 1000;
    return c;
}

// Collects results delivered on the network thread
struct ResultLog {
    std::mutex mtx;
    std::vector<TranslationResult> results;

    ResultCallback sink() {
        return [this](const TranslationResult& r) {
            std::lock_guard lock(mtx);
            results.push_back(r);
        };
    }

    size_t size() {
        std::lock_guard lock(mtx);
        return results.size();
    }

    TranslationResult at(size_t i) {
        std::lock_guard lock(mtx);
        return results.at(i);
    }
};

const char* kFinalTranscript =
    R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"你好"})";
const char* kFinalTranslation = R"({"type":"response.text.done","text":"Hello"})";

} // namespace

TEST(StreamingSession, MissingCredentialThrowsAtConstruction) {
    unsetenv("DASHSCOPE_API_KEY");
    AppConfig c = testConfig();
    c.service.apiKey.clear();

    FakeTransportHub hub;
    EXPECT_THROW(StreamingSession("mic", c, hub.factory()), MissingCredential);
}

TEST(StreamingSession, CredentialFromEnvironment) {
    setenv("DASHSCOPE_API_KEY", "sk-env", 1);
    AppConfig c = testConfig();
    c.service.apiKey.clear();

    FakeTransportHub hub;
    StreamingSession session("mic", c, hub.factory());
    session.start("en", [](const TranslationResult&) {});

    auto ep = [&] { std::lock_guard lock(hub.link(0)->mtx); return hub.link(0)->endpoint; }();
    ASSERT_EQ(ep.headers.size(), 1u);
    EXPECT_EQ(ep.headers[0].first, "Authorization");
    EXPECT_EQ(ep.headers[0].second, "Bearer sk-env");

    session.stop();
    unsetenv("DASHSCOPE_API_KEY");
}

TEST(StreamingSession, StopOnNeverStartedSessionIsNoOp) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    EXPECT_NO_THROW(session.stop());
    EXPECT_NO_THROW(session.stop());
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(session.state(), StreamingSession::State::Idle);
    EXPECT_EQ(hub.count(), 0u);
}

TEST(StreamingSession, StartConfiguresThenStreams) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("ja", [](const TranslationResult&) {});
    EXPECT_TRUE(session.isRunning());
    EXPECT_EQ(session.state(), StreamingSession::State::Streaming);

    auto link = hub.link(0);
    auto sent = link->sentMessages();
    ASSERT_FALSE(sent.empty());
    auto update = nlohmann::json::parse(sent[0]);
    EXPECT_EQ(update["type"], "session.update");
    EXPECT_EQ(update["session"]["translation"]["language"], "ja");

    {
        std::lock_guard lock(link->mtx);
        EXPECT_NE(link->endpoint.url.find("?model=qwen3-livetranslate-flash-realtime"),
                  std::string::npos);
    }

    session.stop();
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(session.state(), StreamingSession::State::Closed);
    EXPECT_TRUE(link->isClosed());
}

TEST(StreamingSession, StopTwiceAfterStart) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("en", [](const TranslationResult&) {});
    EXPECT_NO_THROW(session.stop());
    EXPECT_NO_THROW(session.stop());
    EXPECT_FALSE(session.isRunning());
}

TEST(StreamingSession, StartWhileRunningIsNoOp) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("en", [](const TranslationResult&) {});
    session.start("en", [](const TranslationResult&) {});
    EXPECT_EQ(hub.count(), 1u);
    session.stop();
}

TEST(StreamingSession, DeliversClassifiedResults) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    ResultLog log;

    session.start("en", log.sink());
    auto link = hub.link(0);
    link->push(R"({"type":"session.created","session":{"id":"s1"}})");
    link->push(kFinalTranscript);
    link->push(R"({"type":"input_audio_buffer.speech_stopped"})");
    link->push(kFinalTranslation);

    ASSERT_TRUE(waitFor([&] { return log.size() == 2; }));
    EXPECT_EQ(log.at(0).sourceText, "你好");
    EXPECT_TRUE(log.at(0).isFinal);
    EXPECT_EQ(log.at(1).translatedText, "Hello");
    EXPECT_TRUE(log.at(1).isFinal);
    EXPECT_TRUE(waitFor([&] { return session.stats().resultsDelivered == 2; }));

    session.stop();
}

TEST(StreamingSession, MalformedMessagesAreSkipped) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    ResultLog log;

    session.start("en", log.sink());
    auto link = hub.link(0);
    link->push("{not json");
    link->push(R"({"no_type":true})");
    link->push(kFinalTranslation);

    ASSERT_TRUE(waitFor([&] { return log.size() == 1; }));
    EXPECT_EQ(session.stats().parseFailures, 2u);
    EXPECT_TRUE(session.isRunning());
    session.stop();
}

TEST(StreamingSession, AudioIsDroppedUnlessStreaming) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    std::vector<uint8_t> frame(3200, 0x11);

    session.sendAudio(frame);   // never started
    EXPECT_EQ(session.stats().framesDropped, 1u);

    session.start("en", [](const TranslationResult&) {});
    session.sendAudio(frame);
    session.sendAudio(frame);
    EXPECT_EQ(session.stats().framesSent, 2u);
    EXPECT_EQ(session.stats().bytesSent, 6400u);

    auto link = hub.link(0);
    EXPECT_EQ(link->countSent("input_audio_buffer.append"), 2u);

    session.stop();
    session.sendAudio(frame);
    EXPECT_EQ(session.stats().framesDropped, 2u);
    EXPECT_EQ(link->countSent("input_audio_buffer.append"), 2u);
}

TEST(StreamingSession, EmptyFrameIsIgnored) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.sendAudio({});
    EXPECT_EQ(session.stats().framesDropped, 0u);
    EXPECT_EQ(session.stats().framesSent, 0u);
}

TEST(StreamingSession, ConnectionFailureThrowsAndLeavesError) {
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.refuse = true; };
    StreamingSession session("mic", testConfig(), hub.factory());

    EXPECT_THROW(session.start("en", [](const TranslationResult&) {}), ConnectionError);
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(session.state(), StreamingSession::State::Error);
    EXPECT_EQ(session.lastError(), "connection refused");
    EXPECT_NO_THROW(session.stop());
}

TEST(StreamingSession, RestartAfterFailure) {
    FakeTransportHub hub;
    bool refuseNext = true;
    hub.configure = [&](FakeLink& l) {
        l.refuse = refuseNext;
        refuseNext = false;
    };
    StreamingSession session("mic", testConfig(), hub.factory());

    EXPECT_THROW(session.start("en", [](const TranslationResult&) {}), ConnectionError);
    session.start("en", [](const TranslationResult&) {});
    EXPECT_TRUE(session.isRunning());
    EXPECT_EQ(hub.count(), 2u);
    session.stop();
}

TEST(StreamingSession, TransportDropEndsStreaming) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("en", [](const TranslationResult&) {});
    {
        std::lock_guard lock(hub.link(0)->mtx);
        hub.link(0)->closed = true;   // remote went away
    }
    hub.link(0)->cv.notify_all();

    EXPECT_TRUE(waitFor([&] { return !session.isRunning(); }));
    EXPECT_EQ(session.state(), StreamingSession::State::Error);
    EXPECT_NO_THROW(session.stop());
}

TEST(StreamingSession, WaitsForAcknowledgementWhenRequired) {
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.ackOnUpdate = true; };
    AppConfig c = testConfig();
    c.service.requireConfigAck = true;
    StreamingSession session("mic", c, hub.factory());

    session.start("en", [](const TranslationResult&) {});
    EXPECT_EQ(session.state(), StreamingSession::State::Streaming);
    session.stop();
}

TEST(StreamingSession, StopDuringConnectCancelsStart) {
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.silent = true; };
    StreamingSession session("mic", testConfig(), hub.factory());

    std::thread starter([&] {
        EXPECT_NO_THROW(session.start("en", [](const TranslationResult&) {}));
    });

    ASSERT_TRUE(waitFor([&] { return hub.count() == 1; }));
    ASSERT_TRUE(waitFor([&] {
        return session.state() == StreamingSession::State::Connecting;
    }));
    session.stop();
    starter.join();

    EXPECT_FALSE(session.isRunning());
    EXPECT_TRUE(hub.link(0)->isClosed());
}

TEST(StreamingSession, StopWhileTransportIsCreatedCancelsStart) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    hub.configure = [&](FakeLink&) {
        std::thread([&] { session.stop(); }).join();
    };

    EXPECT_NO_THROW(session.start("en", [](const TranslationResult&) {}));
    EXPECT_FALSE(session.isRunning());
    EXPECT_NE(session.state(), StreamingSession::State::Streaming);
    ASSERT_EQ(hub.count(), 1u);
    EXPECT_TRUE(hub.link(0)->isClosed());

    // the cancelled start left nothing behind
    hub.configure = nullptr;
    session.start("en", [](const TranslationResult&) {});
    EXPECT_TRUE(session.isRunning());
    session.stop();
}

TEST(StreamingSession, StopDuringLanguageSwitchLeavesSessionStopped) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    ResultLog log;

    session.start("en", log.sink());
    hub.configure = [&](FakeLink&) {
        std::thread([&] { session.stop(); }).join();
    };

    EXPECT_NO_THROW(session.switchLanguage("fr"));
    EXPECT_FALSE(session.isRunning());
    EXPECT_NE(session.state(), StreamingSession::State::Streaming);
    ASSERT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.link(0)->isClosed());
    EXPECT_TRUE(hub.link(1)->isClosed());
    EXPECT_EQ(session.targetLang(), "fr");

    // stopped sessions only remember the target
    hub.configure = nullptr;
    session.switchLanguage("de");
    EXPECT_EQ(hub.count(), 2u);
    EXPECT_EQ(session.targetLang(), "de");
}

TEST(StreamingSession, SwitchLanguageAfterStopDoesNotReconnect) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("en", [](const TranslationResult&) {});
    session.stop();
    session.switchLanguage("ja");

    EXPECT_EQ(hub.count(), 1u);
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(session.targetLang(), "ja");
}

TEST(StreamingSession, CloseFailureIsReportedByStop) {
    FakeTransportHub hub;
    hub.configure = [](FakeLink& l) { l.failClose = true; };
    StreamingSession session("mic", testConfig(), hub.factory());

    session.start("en", [](const TranslationResult&) {});
    EXPECT_THROW(session.stop(), ConnectionError);
    EXPECT_FALSE(session.isRunning());
    EXPECT_EQ(session.state(), StreamingSession::State::Closed);
    EXPECT_EQ(session.lastError(), "socket shutdown failed");
    EXPECT_TRUE(waitFor([&] {
        std::lock_guard lock(hub.link(0)->mtx);
        return hub.link(0)->finished;
    }));

    EXPECT_NO_THROW(session.stop());
}

TEST(StreamingSession, SwitchLanguageRecreatesSessionWithSameSink) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    ResultLog log;
    std::vector<uint8_t> frame(320, 0x22);

    session.start("en", log.sink());
    session.sendAudio(frame);
    auto first = hub.link(0);

    session.switchLanguage("fr");
    EXPECT_TRUE(first->isClosed());
    EXPECT_EQ(session.targetLang(), "fr");
    ASSERT_EQ(hub.count(), 2u);
    auto second = hub.link(1);

    auto update = nlohmann::json::parse(second->sentMessages().at(0));
    EXPECT_EQ(update["session"]["translation"]["language"], "fr");

    session.sendAudio(frame);
    EXPECT_EQ(first->countSent("input_audio_buffer.append"), 1u);
    EXPECT_EQ(second->countSent("input_audio_buffer.append"), 1u);

    second->push(kFinalTranslation);
    ASSERT_TRUE(waitFor([&] { return log.size() == 1; }));
    EXPECT_EQ(log.at(0).targetLang, "fr");

    session.stop();
}

TEST(StreamingSession, SwitchLanguageBeforeStartOnlyStoresTarget) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());

    session.switchLanguage("ko");
    EXPECT_EQ(session.targetLang(), "ko");
    EXPECT_EQ(hub.count(), 0u);
}

TEST(StreamingSession, NoResultsAfterStop) {
    FakeTransportHub hub;
    StreamingSession session("mic", testConfig(), hub.factory());
    ResultLog log;

    session.start("en", log.sink());
    auto link = hub.link(0);
    session.stop();

    link->push(kFinalTranslation);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(log.size(), 0u);
}
