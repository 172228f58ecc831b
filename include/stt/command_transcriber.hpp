#ifndef COMMAND_TRANSCRIBER_HPP
#define COMMAND_TRANSCRIBER_HPP

#include "core/config.hpp"
#include "core/user_session.hpp"
#include "stt/transcriber.hpp"

#include <string>
#include <vector>

class ShutdownSignal;

// Runs an external recognizer once per gesture. `{audio}` in the configured
// argv is replaced by the artifact path; every non-blank line the program
// prints on stdout becomes one segment.
class CommandTranscriber : public Transcriber {
public:
    CommandTranscriber(const AppConfig::Transcriber& config, Environment env,
                       const ShutdownSignal* shutdown = nullptr);

    Result<std::vector<TranscriptSegment>> transcribe(const AudioArtifact& artifact) override;

    std::vector<std::string> commandLine(const std::string& audioPath) const;

private:
    const AppConfig::Transcriber& config_;
    Environment env_;
    const ShutdownSignal* shutdown_;
};

#endif
