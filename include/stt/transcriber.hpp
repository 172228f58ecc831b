#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include "audio/recorder.hpp"
#include "core/fault.hpp"

#include <string>
#include <vector>

struct TranscriptSegment {
    std::string text;   // trimmed, never empty
};

// Recognition backend. Loading happens once, in the implementation's
// constructor; transcribe() is called once per gesture. Failures are
// TranscriptionFailed, TranscriptionTimedOut or Cancelled and are never
// retried.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual Result<std::vector<TranscriptSegment>> transcribe(const AudioArtifact& artifact) = 0;
};

std::string trimText(const std::string& text);

// Appends `raw` as a segment if anything is left after trimming.
void appendSegment(std::vector<TranscriptSegment>& segments, const std::string& raw);

#endif
