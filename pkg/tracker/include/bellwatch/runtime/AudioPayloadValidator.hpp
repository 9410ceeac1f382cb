// Repository: BellWatch
// Component: Audio Payload Validator
// Purpose: Rejects malformed audio before it reaches the detector.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_AUDIO_PAYLOAD_VALIDATOR_HPP_
#define BELLWATCH_RUNTIME_AUDIO_PAYLOAD_VALIDATOR_HPP_

#include <cstddef>
#include <string>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::runtime {

enum class PayloadError {
  kNone = 0,
  kEmpty,       // no bytes
  kOversized,   // larger than max_payload_bytes
  kNotAudio,    // upload MIME type is not audio/*
};

const char* PayloadErrorName(PayloadError error);

class AudioPayloadValidator {
 public:
  explicit AudioPayloadValidator(std::size_t max_payload_bytes);

  struct ValidationResult {
    bool valid;
    PayloadError error;
    std::string detail;

    static ValidationResult Success() { return {true, PayloadError::kNone, ""}; }

    static ValidationResult Failure(PayloadError err, const std::string& detail = "") {
      return {false, err, detail};
    }
  };

  // Uploads must declare an audio/* MIME type.
  ValidationResult ValidateUpload(const AudioPayload& payload) const;

  // Streamed chunks carry raw bytes only; size checks apply.
  ValidationResult ValidateChunk(const AudioPayload& payload) const;

 private:
  ValidationResult ValidateSize(const AudioPayload& payload) const;

  std::size_t max_payload_bytes_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_AUDIO_PAYLOAD_VALIDATOR_HPP_
