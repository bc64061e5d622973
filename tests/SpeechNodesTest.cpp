#include <gtest/gtest.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include "core/Pipeline.hpp"
#include "nodes/RawPcmOutputNode.hpp"
#include "nodes/TextProcessingNode.hpp"
#include "streaming/RealtimeAgentNode.hpp"
#include "streaming/TextToSpeechNode.hpp"
#include "streaming/TranscriptionNode.hpp"

namespace {

std::string textOf(const FakeWire::Frame& f) { return std::string(f.data.begin(), f.data.end()); }

AudioBufferPtr silence(size_t bytes, AudioFormat fmt = AudioFormat::defaultFormat()) {
  return makeAudioBuffer(std::vector<uint8_t>(bytes, 0), fmt);
}

} // namespace

TEST(TranscriptionNode, SendsWholeBufferWhenIdle) {
  auto wire = std::make_shared<FakeWire>();
  TranscriptionNode stt("stt", "", "ws://stt.local/listen");
  stt.setTransportFactory(fakeFactory(wire));
  ProcessingContext ctx;
  ASSERT_TRUE(stt.acceptAudio(silence(20000), ctx));
  EXPECT_TRUE(stt.isConnected());
  ASSERT_EQ(wire->sentCount(), 1u);
  EXPECT_EQ(wire->sentAt(0).kind, MessageKind::Binary);
  EXPECT_EQ(wire->sentAt(0).data.size(), 20000u);
  EXPECT_EQ(stt.status().processingCount, 1u);
}

TEST(TranscriptionNode, ChunksAudioWhileStreaming) {
  auto wire = std::make_shared<FakeWire>();
  TranscriptionNode stt("stt", "", "ws://stt.local/listen");
  stt.setTransportFactory(fakeFactory(wire));
  stt.startStreaming();
  ProcessingContext ctx;
  ASSERT_TRUE(stt.acceptAudio(silence(20000), ctx));
  ASSERT_EQ(wire->sentCount(), 3u);
  EXPECT_EQ(wire->sentAt(0).data.size(), 8192u);
  EXPECT_EQ(wire->sentAt(1).data.size(), 8192u);
  EXPECT_EQ(wire->sentAt(2).data.size(), 20000u - 2 * 8192u);
  stt.stopStreaming();
}

TEST(TranscriptionNode, RejectsOtherFormats) {
  auto wire = std::make_shared<FakeWire>();
  TranscriptionNode stt("stt", "", "ws://stt.local/listen");
  stt.setTransportFactory(fakeFactory(wire));
  ProcessingContext ctx;
  EXPECT_FALSE(stt.acceptAudio(silence(4410 * 4, AudioFormat::cdQuality()), ctx));
  EXPECT_EQ(wire->connectCount(), 0);
  EXPECT_FALSE(ctx.logMessages().empty());
}

TEST(TranscriptionNode, SendFailureIsReportedNotThrown) {
  auto wire = std::make_shared<FakeWire>();
  wire->failConnect = true;
  TranscriptionNode stt("stt", "", "ws://stt.local/listen");
  stt.setTransportFactory(fakeFactory(wire));
  ProcessingContext ctx;
  EXPECT_FALSE(stt.acceptAudio(silence(3200), ctx));
  EXPECT_EQ(stt.diagnostics().count("LastWebSocketError"), 1u);
}

TEST(TranscriptionNode, ForwardsFinalTranscripts) {
  auto wire = std::make_shared<FakeWire>();
  Pipeline p("voice");
  auto& stt = p.emplaceNode<TranscriptionNode>("stt", "STT", "ws://stt.local/listen");
  auto& text = p.emplaceNode<TextProcessingNode>("text", "Text");
  p.connect("stt", "text").setKind("text");
  stt.setTransportFactory(fakeFactory(wire));
  auto sub = stt.notifications().subscribe();

  stt.startStreaming();
  wire->deliverText(R"({"text":"hel","is_final":false})");
  wire->deliverText("not json");
  wire->deliverText(R"({"text":"hello there","is_final":true})");
  ASSERT_TRUE(waitUntil([&] { return text.lastText() == "hello there"; }));
  stt.stopStreaming();

  EXPECT_EQ(stt.lastTranscript(), "hello there");
  const auto got = drainOfType(*sub, NotificationType::TranscriptionReceived);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_FALSE(got[0].isFinal);
  EXPECT_TRUE(got[1].isFinal);
  EXPECT_EQ(text.status().processingCount, 1u);
}

TEST(TranscriptionNode, PipelineTeardownStopsStreamingWhileFeedIsAlive) {
  auto wire = std::make_shared<FakeWire>();
  std::shared_ptr<NotificationSubscription> sub;
  {
    Pipeline p("voice");
    auto& stt = p.emplaceNode<TranscriptionNode>("stt", "STT", "ws://stt.local/listen");
    stt.setTransportFactory(fakeFactory(wire));
    sub = p.notifications().subscribe();
    // Streaming without initialize(): teardown must still stop the receive loop.
    stt.startStreaming();
    ASSERT_TRUE(stt.isStreaming());
    wire->deliverText(R"({"text":"hi","is_final":true})");
    ASSERT_TRUE(waitUntil([&] { return stt.lastTranscript() == "hi"; }));
  }
  const auto stopped = drainOfType(*sub, NotificationType::StreamingStopped);
  ASSERT_EQ(stopped.size(), 1u);
  EXPECT_EQ(stopped[0].sourceId, "stt");
}

TEST(TranscriptionNode, PartialResultsCanBeForwarded) {
  auto wire = std::make_shared<FakeWire>();
  Pipeline p("voice");
  auto& stt = p.emplaceNode<TranscriptionNode>("stt", "STT", "ws://stt.local/listen");
  auto& text = p.emplaceNode<TextProcessingNode>("text", "Text");
  p.connect("stt", "text").setKind("text");
  stt.setTransportFactory(fakeFactory(wire));
  stt.setForwardPartialResults(true);

  stt.startStreaming();
  wire->deliverText(R"({"text":"hel","is_final":false})");
  ASSERT_TRUE(waitUntil([&] { return text.lastText() == "hel"; }));
  stt.stopStreaming();
}

TEST(TextToSpeechNode, SpeaksAndStreamsAudioDownstream) {
  auto wire = std::make_shared<FakeWire>();
  Pipeline p("voice");
  auto& tts = p.emplaceNode<TextToSpeechNode>("tts", "TTS", "ws://tts.local/speak");
  auto& out = p.emplaceNode<RawPcmOutputNode>("out", "Out");
  p.connect("tts", "out");
  tts.setTransportFactory(fakeFactory(wire));
  auto sub = tts.notifications().subscribe();
  EXPECT_EQ(*tts.outputFormat(), AudioFormat(24000, 1, 16, false));

  tts.startStreaming();
  ProcessingContext ctx;
  ASSERT_TRUE(tts.acceptText("Good morning", ctx));
  EXPECT_TRUE(tts.isSpeaking());
  ASSERT_EQ(wire->sentCount(), 1u);
  EXPECT_EQ(nlohmann::json::parse(textOf(wire->sentAt(0))), (nlohmann::json{{"text", "Good morning"}}));

  // 3 bytes: one whole frame now, the odd byte is held until the next fragment.
  wire->deliver(MessageKind::Binary, {1, 0, 2});
  wire->deliver(MessageKind::Binary, {0});
  wire->deliverText(R"({"audio_complete":true})");
  ASSERT_TRUE(waitUntil([&] { return !tts.isSpeaking(); }));
  tts.stopStreaming();

  const auto audio = drainOfType(*sub, NotificationType::SpeechAudioReceived);
  ASSERT_EQ(audio.size(), 2u);
  EXPECT_EQ(audio[0].audio->size(), 2u);
  EXPECT_EQ(audio[1].audio->bytes(), (std::vector<uint8_t>{2, 0}));
  ASSERT_TRUE(out.lastAudio());
  EXPECT_EQ(out.lastAudio()->format(), AudioFormat(24000, 1, 16, false));
  EXPECT_EQ(out.status().processingCount, 2u);
  ProcessingContext readCtx;
  EXPECT_EQ(tts.audioOutput(readCtx)->bytes(), (std::vector<uint8_t>{2, 0}));
}

TEST(TextToSpeechNode, SpeechCompletedIsPublished) {
  auto wire = std::make_shared<FakeWire>();
  TextToSpeechNode tts("tts", "", "ws://tts.local/speak");
  tts.setTransportFactory(fakeFactory(wire));
  auto sub = tts.notifications().subscribe();
  tts.startStreaming();
  tts.speakText("hi");
  wire->deliverText(R"({"audio_complete":true})");
  ASSERT_TRUE(waitUntil([&] { return !tts.isSpeaking(); }));
  tts.stopStreaming();
  EXPECT_EQ(drainOfType(*sub, NotificationType::SpeechCompleted).size(), 1u);
}

TEST(TextToSpeechNode, ConfiguredOutputFormat) {
  TextToSpeechNode tts("tts", "");
  tts.configure(nlohmann::json{{"outputFormat", {{"sampleRate", 16000}, {"channels", 1}, {"bitsPerSample", 16}}}});
  EXPECT_EQ(*tts.outputFormat(), AudioFormat::defaultFormat());
  ProcessingContext ctx;
  EXPECT_FALSE(tts.acceptText("", ctx));
}

namespace {

struct RecordedCall {
  std::string url;
  HttpHeaders headers;
  std::string body;
};

} // namespace

TEST(RealtimeAgentNode, CreatesCallThenJoinsSocket) {
  auto wire = std::make_shared<FakeWire>();
  RealtimeAgentNode agent("agent", "Agent");
  agent.configure(nlohmann::json{{"controlUrl", "https://control.local/calls"}, {"apiKey", "k-123"}, {"voice", "Jessica"}});
  agent.setTransportFactory(fakeFactory(wire));
  std::vector<RecordedCall> calls;
  agent.setCallRequester([&](const std::string& url, const HttpHeaders& headers, const std::string& body) {
    calls.push_back(RecordedCall{url, headers, body});
    return HttpResponse{201, R"({"joinUrl":"wss://voice.local/join/abc"})"};
  });

  agent.connect();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].url, "https://control.local/calls");
  ASSERT_EQ(calls[0].headers.size(), 1u);
  EXPECT_EQ(calls[0].headers[0].first, "X-API-Key");
  EXPECT_EQ(calls[0].headers[0].second, "k-123");
  const auto body = nlohmann::json::parse(calls[0].body);
  EXPECT_EQ(body.at("voice"), "Jessica");
  EXPECT_EQ(body.at("medium").at("serverWebSocket").at("inputSampleRate"), 8000);
  EXPECT_EQ(wire->lastUri(), "wss://voice.local/join/abc");
  EXPECT_EQ(agent.joinUrl(), "wss://voice.local/join/abc");
  EXPECT_EQ(agent.diagnostics().at("JoinUrl"), "wss://voice.local/join/abc");

  // The join url is reused for the next connect.
  agent.disconnect();
  agent.connect();
  EXPECT_EQ(calls.size(), 1u);
  EXPECT_EQ(wire->connectCount(), 2);
}

TEST(RealtimeAgentNode, FailedCallCreationThrows) {
  auto wire = std::make_shared<FakeWire>();
  RealtimeAgentNode agent("agent", "");
  agent.setTransportFactory(fakeFactory(wire));
  agent.setCallRequester([](const std::string&, const HttpHeaders&, const std::string&) {
    return HttpResponse{401, R"({"detail":"bad key"})"};
  });
  EXPECT_THROW(agent.connect(), TransportError);
  EXPECT_EQ(wire->connectCount(), 0);

  agent.setCallRequester([](const std::string&, const HttpHeaders&, const std::string&) {
    return HttpResponse{200, R"({"id":"call-1"})"};
  });
  EXPECT_THROW(agent.connect(), TransportError);
}

TEST(RealtimeAgentNode, SendsAgentFormatAudioAndSurfacesTranscripts) {
  auto wire = std::make_shared<FakeWire>();
  RealtimeAgentNode agent("agent", "");
  agent.setTransportFactory(fakeFactory(wire));
  agent.setCallRequester([](const std::string&, const HttpHeaders&, const std::string&) {
    return HttpResponse{200, R"({"joinUrl":"wss://voice.local/join/1"})"};
  });
  auto sub = agent.notifications().subscribe();
  agent.startStreaming();

  ProcessingContext ctx;
  EXPECT_FALSE(agent.acceptAudio(silence(3200), ctx)); // 16 kHz, agent speaks 8 kHz
  ASSERT_TRUE(agent.acceptAudio(silence(1600, AudioFormat(8000, 1, 16, false)), ctx));
  ASSERT_EQ(wire->sentCount(), 1u);
  EXPECT_EQ(wire->sentAt(0).data.size(), 1600u);

  wire->deliverText(R"({"text":"How can I help?"})");
  wire->deliver(MessageKind::Binary, {0, 1, 0, 2});
  ASSERT_TRUE(waitUntil([&] { ProcessingContext c; return agent.audioOutput(c) != nullptr; }));
  agent.stopStreaming();

  const auto transcripts = drainOfType(*sub, NotificationType::TranscriptionReceived);
  ASSERT_EQ(transcripts.size(), 1u);
  EXPECT_EQ(transcripts[0].text, "How can I help?");
  EXPECT_TRUE(transcripts[0].isFinal);
  ProcessingContext c;
  EXPECT_EQ(agent.audioOutput(c)->format(), AudioFormat(8000, 1, 16, false));
}
