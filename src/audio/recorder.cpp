#include "audio/recorder.hpp"
#include "process/subprocess.hpp"

// Out of line so Subprocess stays incomplete in the header.
RecordingSession::RecordingSession() = default;
RecordingSession::RecordingSession(RecordingSession&&) noexcept = default;
RecordingSession& RecordingSession::operator=(RecordingSession&&) noexcept = default;
RecordingSession::~RecordingSession() = default;
