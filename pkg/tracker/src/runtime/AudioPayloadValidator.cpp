// Repository: BellWatch
// Component: Audio Payload Validator
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/AudioPayloadValidator.hpp"

#include <sstream>

namespace bellwatch::runtime {

namespace {

constexpr char kAudioMimePrefix[] = "audio/";

}  // namespace

const char* PayloadErrorName(PayloadError error) {
  switch (error) {
    case PayloadError::kNone:
      return "NONE";
    case PayloadError::kEmpty:
      return "EMPTY";
    case PayloadError::kOversized:
      return "OVERSIZED";
    case PayloadError::kNotAudio:
      return "NOT_AUDIO";
  }
  return "UNKNOWN";
}

AudioPayloadValidator::AudioPayloadValidator(std::size_t max_payload_bytes)
    : max_payload_bytes_(max_payload_bytes) {}

AudioPayloadValidator::ValidationResult AudioPayloadValidator::ValidateSize(
    const AudioPayload& payload) const {
  if (payload.data.empty()) {
    return ValidationResult::Failure(PayloadError::kEmpty, "No audio data provided");
  }
  if (payload.data.size() > max_payload_bytes_) {
    std::ostringstream oss;
    oss << "Audio payload of " << payload.data.size()
        << " bytes exceeds limit of " << max_payload_bytes_ << " bytes";
    return ValidationResult::Failure(PayloadError::kOversized, oss.str());
  }
  return ValidationResult::Success();
}

AudioPayloadValidator::ValidationResult AudioPayloadValidator::ValidateUpload(
    const AudioPayload& payload) const {
  auto result = ValidateSize(payload);
  if (!result.valid) return result;

  if (payload.mime_type.compare(0, sizeof(kAudioMimePrefix) - 1, kAudioMimePrefix) != 0) {
    return ValidationResult::Failure(
        PayloadError::kNotAudio,
        "Only audio files are allowed (got '" + payload.mime_type + "')");
  }
  return ValidationResult::Success();
}

AudioPayloadValidator::ValidationResult AudioPayloadValidator::ValidateChunk(
    const AudioPayload& payload) const {
  return ValidateSize(payload);
}

}  // namespace bellwatch::runtime
