#pragma once

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "../streaming/StreamingNode.hpp"

using TextProcessor = std::function<std::string(const std::string&, ProcessingContext&)>;

// Runs text through a chain of processors and forwards the result to text-accepting nodes.
// "trim", "prefix" and "suffix" in the configuration apply after the chain.
class TextProcessingNode : public StreamingNode {
public:
  using StreamingNode::StreamingNode;

  const char* typeName() const override { return "text_processor"; }
  CapabilitySet capabilities() const override { return {Capability::Streaming}; }

  void addProcessor(TextProcessor processor) {
    if (!processor) throw std::invalid_argument("Text node '" + id() + "': processor must not be empty");
    std::lock_guard<std::mutex> lk(m_);
    processors_.push_back(std::move(processor));
  }
  size_t processorCount() const { std::lock_guard<std::mutex> lk(m_); return processors_.size(); }

  bool acceptText(const std::string& text, ProcessingContext& context) override {
    if (!enabled() || context.isCancelled()) return false;
    processText(text, context);
    return true;
  }

  std::string processText(const std::string& input, ProcessingContext& context) {
    if (!enabled() || input.empty()) return input;
    context.logInfo("Processing text: " + input);
    std::vector<TextProcessor> chain;
    {
      std::lock_guard<std::mutex> lk(m_);
      chain = processors_;
    }
    const auto t0 = std::chrono::steady_clock::now();
    std::string text = input;
    try {
      for (const auto& p : chain) text = p(text, context);
    } catch (const std::exception& e) {
      recordError("LastError", e.what());
      context.logError("Text node '" + id() + "' failed: " + e.what());
      throw;
    }
    if (configuration().value("trim", false)) text = trimmed(text);
    text = configuration().value("prefix", std::string{}) + text + configuration().value("suffix", std::string{});
    trackProcessing(std::chrono::steady_clock::now() - t0);
    {
      std::lock_guard<std::mutex> lk(m_);
      lastText_ = text;
    }
    context.logInfo("Processed text: " + text);

    Notification n;
    n.type = NotificationType::TextProcessed;
    n.sessionId = context.sessionId();
    n.text = text;
    publish(n);
    propagateText(text, context);
    return text;
  }

  std::string lastText() const { std::lock_guard<std::mutex> lk(m_); return lastText_; }

protected:
  void onReset() override { std::lock_guard<std::mutex> lk(m_); lastText_.clear(); }

private:
  static std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    return s.substr(b, s.find_last_not_of(ws) - b + 1);
  }

  mutable std::mutex m_;
  std::vector<TextProcessor> processors_{};
  std::string lastText_;
};
