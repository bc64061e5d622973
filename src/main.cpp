#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "core/Cancellation.hpp"
#include "core/Errors.hpp"
#include "core/NodeFactory.hpp"
#include "core/Pipeline.hpp"
#include "core/PipelineConfig.hpp"
#include "core/PipelineUtils.hpp"
#include "core/Random.hpp"
#include "io/RawPcmFile.hpp"
#include "offline/OfflinePipelineRunner.hpp"
#include "offline/OfflineProgress.hpp"

static std::atomic<bool> gRunning{true};

static void onSigInt(int) {
  gRunning.store(false);
}

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s --pipeline path.json --input audio.pcm --output out.(pcm|wav)\n"
               "          [--sr Hz] [--channels N] [--bits 16|24|32] [--float] [--chunk-ms MS]\n"
               "          [--output-node ID] [--no-progress] [--random-seed N] [--save path.json]\n"
               "\nInput format (headerless PCM; default 16000 Hz, mono, 16-bit):\n"
               "  --sr HZ            Sample rate\n"
               "  --channels N       Channel count\n"
               "  --bits N           Bits per sample\n"
               "  --float            Samples are IEEE float (implies --bits 32)\n"
               "  --chunk-ms MS      Chunk size fed per pipeline pass (default 20)\n"
               "  --output-node ID   Node whose audio is written (default: first terminal exit)\n"
               "\nInspection:\n"
               "  --validate path.json        Check structure and connection compatibility\n"
               "  --list-node-types           Print registered node types\n"
               "  --print-topo path.json      Print topological node order\n"
               "  --export-dot path.json      Print pipeline as Graphviz DOT to stdout\n"
               "  --export-mermaid path.json  Print pipeline as Mermaid flowchart to stdout\n"
               "\nRelative JSON paths are also searched under VOXFLOW_SEARCH_PATHS (colon-separated).\n",
               exe);
}

static void printException(const std::exception& e, int depth = 0) {
  std::fprintf(stderr, "%s%s\n", depth == 0 ? "Error: " : "  caused by: ", e.what());
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    printException(inner, depth + 1);
  }
}

static bool endsWith(const std::string& s, const char* suffix) {
  const size_t n = std::strlen(suffix);
  return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

// Structural checks, then a trial build with connection validation. Returns true when clean.
static bool validatePipelineFile(const std::string& path, const NodeRegistry& registry) {
  const PipelineSpec spec = loadPipelineSpecFromJsonFile(path);
  const auto issues = checkPipelineSpec(spec, &registry);
  for (const auto& s : issues) std::fprintf(stderr, "  - %s\n", s.c_str());
  if (!issues.empty()) {
    std::fprintf(stderr, "Invalid pipeline %s: %zu issue(s)\n", path.c_str(), issues.size());
    return false;
  }
  auto pipeline = buildPipeline(spec, registry);
  bool ok = true;
  for (const Connection* c : pipeline->connections()) {
    try {
      if (!c->validate()) {
        std::fprintf(stderr, "  - connection '%s': node self-check failed\n", c->id().c_str());
        ok = false;
      }
    } catch (const ConnectionIncompatible& e) {
      std::fprintf(stderr, "  - %s\n", e.what());
      ok = false;
    }
  }
  if (!hasValidPath(*pipeline)) std::fprintf(stderr, "Warning: no path from an entry point to an exit point\n");
  std::fprintf(stderr, "%s pipeline %s (%zu nodes, %zu connections)\n", ok ? "Valid" : "Invalid", path.c_str(),
               spec.nodes.size(), spec.connections.size());
  return ok;
}

int main(int argc, char** argv) {
  std::string pipelinePath;
  std::string inputPath;
  std::string outputPath;
  std::string savePath;
  std::string validatePath;
  std::string topoPath;
  std::string dotPath;
  std::string mermaidPath;
  std::string outputNodeId;
  bool listNodeTypes = false;
  uint32_t sampleRate = 16000;
  uint32_t channels = 1;
  uint32_t bits = 16;
  bool isFloat = false;
  uint32_t chunkMs = 20;
  uint32_t randomSeed = 0; // 0 means unspecified
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need = [&](int remain) {
      if (i + remain >= argc) {
        printUsage(argv[0]);
        std::exit(1);
      }
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--pipeline") == 0) {
      need(1); pipelinePath = argv[++i];
    } else if (std::strcmp(a, "--input") == 0) {
      need(1); inputPath = argv[++i];
    } else if (std::strcmp(a, "--output") == 0) {
      need(1); outputPath = argv[++i];
    } else if (std::strcmp(a, "--sr") == 0) {
      need(1); sampleRate = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--channels") == 0) {
      need(1); channels = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--bits") == 0) {
      need(1); bits = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--float") == 0) {
      isFloat = true; bits = 32;
    } else if (std::strcmp(a, "--chunk-ms") == 0) {
      need(1); chunkMs = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
      if (chunkMs == 0) chunkMs = 1;
    } else if (std::strcmp(a, "--output-node") == 0) {
      need(1); outputNodeId = argv[++i];
    } else if (std::strcmp(a, "--no-progress") == 0) {
      gOfflineProgressEnabled = false;
    } else if (std::strcmp(a, "--random-seed") == 0) {
      need(1); randomSeed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(a, "--save") == 0) {
      need(1); savePath = argv[++i];
    } else if (std::strcmp(a, "--validate") == 0) {
      need(1); validatePath = argv[++i];
    } else if (std::strcmp(a, "--list-node-types") == 0) {
      listNodeTypes = true;
    } else if (std::strcmp(a, "--print-topo") == 0) {
      need(1); topoPath = argv[++i];
    } else if (std::strcmp(a, "--export-dot") == 0) {
      need(1); dotPath = argv[++i];
    } else if (std::strcmp(a, "--export-mermaid") == 0) {
      need(1); mermaidPath = argv[++i];
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a);
      printUsage(argv[0]);
      return 1;
    }
  }

  if (randomSeed != 0) setGlobalSeed(randomSeed);
  NodeRegistry registry;
  registerBuiltinNodeTypes(registry);

  try {
    if (listNodeTypes) {
      for (const auto& t : registry.typeNames()) std::printf("%s\n", t.c_str());
      return 0;
    }
    if (!validatePath.empty()) {
      return validatePipelineFile(validatePath, registry) ? 0 : 2;
    }
    if (!topoPath.empty()) {
      const PipelineSpec spec = loadPipelineSpecFromJsonFile(topoPath);
      printTopoOrderFromSpec(spec);
      printConnectionsSummary(spec);
      return 0;
    }
    if (!dotPath.empty() || !mermaidPath.empty()) {
      const std::string& p = dotPath.empty() ? mermaidPath : dotPath;
      auto pipeline = buildPipeline(loadPipelineSpecFromJsonFile(p), registry);
      std::printf("%s", dotPath.empty() ? toMermaid(*pipeline).c_str() : toDotGraph(*pipeline).c_str());
      return 0;
    }
    if (pipelinePath.empty()) {
      printUsage(argv[0]);
      return 1;
    }

    auto pipeline = buildPipeline(loadPipelineSpecFromJsonFile(pipelinePath), registry);
    std::fprintf(stderr, "voxflow -- pipeline '%s' (%zu nodes, %zu connections)\n", pipeline->name().c_str(),
                 pipeline->nodes().size(), pipeline->connections().size());
    if (!savePath.empty()) {
      savePipelineToJsonFile(*pipeline, savePath);
      std::fprintf(stderr, "Saved pipeline to %s\n", savePath.c_str());
    }
    if (inputPath.empty()) {
      if (savePath.empty()) { printUsage(argv[0]); return 1; }
      return 0;
    }
    if (outputPath.empty()) {
      std::fprintf(stderr, "--input requires --output\n");
      return 1;
    }

    const AudioFormat fmt(sampleRate, static_cast<uint16_t>(channels), static_cast<uint16_t>(bits), isFloat);
    const auto input = loadRawPcm(inputPath, fmt);
    std::fprintf(stderr, "Input %s: %.3fs of %s\n", inputPath.c_str(), input->durationSeconds(), fmt.toString().c_str());

    std::signal(SIGINT, onSigInt);
    CancellationSource cancel;
    std::atomic<bool> done{false};
    std::thread watcher([&] {
      while (!done.load()) {
        if (!gRunning.load()) { cancel.cancel(); break; }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
    OfflineRunResult result;
    try {
      pipeline->initialize();
      ProcessingContext context(std::string{}, cancel.token());
      result = runPipelineOffline(*pipeline, *input, chunkMs, context, outputNodeId);
      for (const auto& m : context.logMessages()) {
        if (m.level != LogLevel::Information) std::fprintf(stderr, "[%s] %s\n", logLevelName(m.level), m.message.c_str());
      }
    } catch (...) {
      done.store(true);
      watcher.join();
      throw;
    }
    done.store(true);
    watcher.join();
    pipeline->shutdown();

    if (result.cancelled) std::fprintf(stderr, "Interrupted after %zu chunk(s)\n", result.chunks);
    if (!result.output) {
      std::fprintf(stderr, "Pipeline produced no audio (%zu chunk(s))\n", result.chunks);
      return 2;
    }
    if (endsWith(outputPath, ".wav")) writeWavFile(outputPath, *result.output);
    else saveRawPcm(outputPath, *result.output);
    std::fprintf(stderr, "Wrote %s: %.3fs of %s\n", outputPath.c_str(), result.output->durationSeconds(),
                 result.output->format().toString().c_str());
    return 0;
  } catch (const std::exception& e) {
    printException(e);
    return 2;
  }
}
