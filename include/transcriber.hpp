#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct TranscriptSegment {
    std::string text;
    std::string speaker_id;
};

// Turns an exported WAV file into transcript segments.
class Transcriber {
public:
    explicit Transcriber(const std::string& model_path);
    ~Transcriber();

    bool available() const;

    std::vector<TranscriptSegment> transcribe(const std::vector<uint8_t>& wav_file);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
