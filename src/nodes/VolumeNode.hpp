#pragma once

#include <cmath>
#include "../core/Node.hpp"
#include "../dsp/PcmSamples.hpp"

// Scales samples by "gain" with clamping. Unity gain passes the input through untouched.
class VolumeNode : public ProcessorNode {
public:
  using ProcessorNode::ProcessorNode;
  const char* typeName() const override { return "volume"; }

  double gain() const { return configuration().value("gain", 1.0); }
  void setGain(double g) { configuration()["gain"] = g; }

protected:
  AudioBufferPtr processAudio(const AudioBufferPtr& input, ProcessingContext& context) override {
    setOutputFormat(input->format());
    const double g = gain();
    if (std::fabs(g - 1.0) < 0.001) return input;
    const AudioFormat& fmt = input->format();
    if (!fmt.isPcm16() && !fmt.isFloat32()) {
      context.logWarning("Volume node '" + id() + "' cannot scale " + fmt.toString() + "; passing through");
      return input;
    }
    auto out = input->clone();
    auto& bytes = out->mutableBytes();
    if (fmt.isPcm16()) {
      for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        writePcm16(&bytes[i], clampToPcm16(static_cast<double>(readPcm16(&bytes[i])) * g));
      }
    } else {
      for (size_t i = 0; i + 3 < bytes.size(); i += 4) {
        writeFloat32(&bytes[i], clampUnit(static_cast<double>(readFloat32(&bytes[i])) * g));
      }
    }
    return out;
  }
};
