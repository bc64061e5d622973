#include <gtest/gtest.h>
#include <stdexcept>
#include "TestSupport.hpp"
#include "core/Pipeline.hpp"
#include "nodes/TextProcessingNode.hpp"

namespace {

class ScopedStreamNode : public StreamingNode {
public:
  using StreamingNode::StreamingNode;
  const char* typeName() const override { return "scoped"; }
  CapabilitySet capabilities() const override { return {Capability::Streaming}; }

  int starts = 0;
  int stops = 0;
  bool failStart = false;
  CancellationToken seen{};

protected:
  void onStartStreaming(const CancellationToken& token) override {
    if (failStart) throw std::runtime_error("device busy");
    ++starts;
    seen = token;
  }
  void onStopStreaming() override { ++stops; }
};

// Collects text delivered over text connections.
class TextSink : public Node {
public:
  using Node::Node;
  const char* typeName() const override { return "text_sink"; }
  CapabilitySet capabilities() const override { return {}; }
  bool acceptText(const std::string& text, ProcessingContext&) override { received.push_back(text); return true; }
  std::vector<std::string> received;
};

} // namespace

TEST(StreamingNode, StartAndStopAreIdempotent) {
  ScopedStreamNode node("s", "");
  auto sub = node.notifications().subscribe();
  node.startStreaming();
  node.startStreaming();
  EXPECT_TRUE(node.isStreaming());
  node.stopStreaming();
  node.stopStreaming();
  EXPECT_FALSE(node.isStreaming());
  std::vector<Notification> all;
  sub->drain(all);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].type, NotificationType::StreamingStarted);
  EXPECT_EQ(all[1].type, NotificationType::StreamingStopped);
  EXPECT_EQ(node.starts, 1);
  EXPECT_EQ(node.stops, 1);
}

TEST(StreamingNode, StopCancelsTheStreamingScope) {
  ScopedStreamNode node("s", "");
  auto sub = node.notifications().subscribe();
  node.startStreaming();
  const auto started = drainOfType(*sub, NotificationType::StreamingStarted);
  ASSERT_EQ(started.size(), 1u);
  ASSERT_TRUE(started[0].context);
  EXPECT_FALSE(started[0].context->isCancelled());
  EXPECT_FALSE(node.seen.isCancellationRequested());
  node.stopStreaming();
  EXPECT_TRUE(node.seen.isCancellationRequested());
  EXPECT_TRUE(started[0].context->isCancelled());
}

TEST(StreamingNode, FailedStartLeavesNodeIdle) {
  ScopedStreamNode node("s", "");
  node.failStart = true;
  auto sub = node.notifications().subscribe();
  EXPECT_THROW(node.startStreaming(), std::runtime_error);
  EXPECT_FALSE(node.isStreaming());
  EXPECT_EQ(sub->pending(), 0u);
  node.failStart = false;
  node.startStreaming();
  EXPECT_TRUE(node.isStreaming());
}

TEST(StreamingNode, ShutdownStopsStreaming) {
  ScopedStreamNode node("s", "");
  node.initialize();
  node.startStreaming();
  node.shutdown();
  EXPECT_FALSE(node.isStreaming());
  EXPECT_FALSE(node.status().initialized);
}

TEST(TextProcessingNode, RunsChainAndForwardsResult) {
  Pipeline p;
  auto& text = p.emplaceNode<TextProcessingNode>("t", "Text");
  auto& sink = p.emplaceNode<TextSink>("sink", "");
  p.connect("t", "sink").setKind("text");
  text.addProcessor([](const std::string& s, ProcessingContext&) { return s + "!"; });
  text.addProcessor([](const std::string& s, ProcessingContext&) { return "<" + s + ">"; });
  text.configure(nlohmann::json{{"trim", true}, {"prefix", "bot: "}});
  auto sub = text.notifications().subscribe();

  ProcessingContext ctx;
  EXPECT_EQ(text.processText("hi", ctx), "bot: <hi!>");
  ASSERT_EQ(sink.received.size(), 1u);
  EXPECT_EQ(sink.received[0], "bot: <hi!>");
  const auto done = drainOfType(*sub, NotificationType::TextProcessed);
  ASSERT_EQ(done.size(), 1u);
  EXPECT_EQ(done[0].text, "bot: <hi!>");
  EXPECT_EQ(p.executionLog().size(), 1u);
}

TEST(TextProcessingNode, DisabledOrEmptyInputIsReturnedUnchanged) {
  TextProcessingNode text("t", "");
  text.addProcessor([](const std::string& s, ProcessingContext&) { return s + "x"; });
  ProcessingContext ctx;
  EXPECT_EQ(text.processText("", ctx), "");
  text.setEnabled(false);
  EXPECT_EQ(text.processText("a", ctx), "a");
  EXPECT_FALSE(text.acceptText("a", ctx));
  EXPECT_THROW(text.addProcessor(TextProcessor{}), std::invalid_argument);
}
