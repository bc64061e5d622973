#pragma once

#include "../core/Node.hpp"

class PassthroughNode : public ProcessorNode {
public:
  using ProcessorNode::ProcessorNode;
  const char* typeName() const override { return "passthrough"; }

protected:
  AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext&) override {
    setOutputFormat(input->format());
    return input;
  }
};
