#include "stt/transcriber.hpp"

std::string trimText(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    const size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

void appendSegment(std::vector<TranscriptSegment>& segments, const std::string& raw) {
    std::string text = trimText(raw);
    if (!text.empty()) segments.push_back(TranscriptSegment{std::move(text)});
}
