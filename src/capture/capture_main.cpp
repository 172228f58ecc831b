// holdtalk-capture: records the default (or given) input device until
// SIGTERM/SIGINT and writes a PCM16 WAV file. Accepts the arecord flags the
// daemon passes, so either binary can be configured as the recorder.

#include "audio/capture_buffer.hpp"
#include "audio/wav_file.hpp"
#include "capture/pcm_capture.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static std::atomic<bool> g_running(true);

static void onStopSignal(int /*sig*/) {
    g_running = false;
}

struct CaptureParams {
    std::string format = "S16_LE";
    std::string fileType = "wav";
    int rate = 16000;
    int channels = 1;
    int device = -1;
    int maxMs = 10 * 60 * 1000;
    bool quiet = false;
    std::string output;
};

static void printUsage(const char* argv0) {
    fprintf(stderr, "usage: %s [-q] [-f S16_LE] [-r RATE] [-c CHANNELS] [-t wav] [-D INDEX] [--max-ms N] FILE\n", argv0);
}

static bool parseInt(const char* s, int& out) {
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (!end || *end != '\0' || v < 0) {
        fprintf(stderr, "error: invalid integer '%s'\n", s);
        return false;
    }
    out = (int)v;
    return true;
}

static bool parseParams(int argc, char** argv, CaptureParams& params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_arg = [&]() -> const char* {
            if (++i >= argc) {
                fprintf(stderr, "error: missing value for %s\n", arg.c_str());
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "-h" || arg == "--help") { printUsage(argv[0]); exit(0); }
        else if (arg == "-q" || arg == "--quiet")    { params.quiet = true; }
        else if (arg == "-f" || arg == "--format")   { auto v = next_arg(); if (!v) return false; params.format = v; }
        else if (arg == "-t" || arg == "--file-type"){ auto v = next_arg(); if (!v) return false; params.fileType = v; }
        else if (arg == "-r" || arg == "--rate")     { auto v = next_arg(); if (!v || !parseInt(v, params.rate)) return false; }
        else if (arg == "-c" || arg == "--channels") { auto v = next_arg(); if (!v || !parseInt(v, params.channels)) return false; }
        else if (arg == "-D" || arg == "--device")   { auto v = next_arg(); if (!v || !parseInt(v, params.device)) return false; }
        else if (               arg == "--max-ms")   { auto v = next_arg(); if (!v || !parseInt(v, params.maxMs)) return false; }
        else if (!arg.empty() && arg[0] == '-') {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
        else if (params.output.empty()) { params.output = arg; }
        else {
            fprintf(stderr, "error: more than one output file given\n");
            return false;
        }
    }

    if (params.output.empty()) {
        fprintf(stderr, "error: no output file\n");
        return false;
    }
    if (params.format != "S16_LE") {
        fprintf(stderr, "error: only S16_LE is supported (got %s)\n", params.format.c_str());
        return false;
    }
    if (params.fileType != "wav") {
        fprintf(stderr, "error: only wav output is supported (got %s)\n", params.fileType.c_str());
        return false;
    }
    if (params.rate <= 0 || params.channels <= 0 || params.maxMs <= 0) {
        fprintf(stderr, "error: rate, channels and --max-ms must be positive\n");
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    CaptureParams params;
    if (!parseParams(argc, argv, params)) {
        printUsage(argv[0]);
        return 1;
    }

    Logger& log = Logger::instance();
    if (params.quiet) log.setLevel(LogLevel::Warn);

    struct sigaction sa{};
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    CaptureBuffer::Config bufferConfig;
    bufferConfig.sampleRate = params.rate;
    bufferConfig.channels = params.channels;
    bufferConfig.maxCaptureMs = params.maxMs;
    CaptureBuffer buffer(bufferConfig);

    PcmCapture::Config captureConfig;
    captureConfig.device = params.device;
    captureConfig.sampleRate = params.rate;
    captureConfig.channels = params.channels;
    captureConfig.framesPerBuffer = bufferConfig.framesPerBuffer;

    int rc = 0;
    try {
        PcmCapture capture(captureConfig);
        log.info("Capture", "Recording from " + capture.deviceName() + " into " + params.output);
        capture.run(buffer, g_running);
    } catch (const std::exception& e) {
        log.error("Capture", e.what());
        rc = 2;
    }

    if (buffer.isFull()) log.warn("Capture", "Capture cap of " + std::to_string(params.maxMs) + " ms reached");

    // Whatever was captured before an audio error is still worth keeping.
    if (!writeWavFile(params.output, buffer.samples(), (uint32_t)params.rate, (uint16_t)params.channels)) {
        log.error("Capture", "Cannot write " + params.output + ": " + std::strerror(errno));
        return 3;
    }

    log.info("Capture", "Wrote " + std::to_string(buffer.capturedMs()) + " ms, peak level "
             + std::to_string(buffer.peakRms()));
    return rc;
}
