/**
 * @file audio_recorder.cpp
 * @brief Запись звука через arecord
 */

#include "hotlaunch/audio_recorder.hpp"

#include "hotlaunch/process_launcher.hpp"

#include <chrono>

namespace hotlaunch {

namespace {

/// Запас поверх длительности записи до принудительного завершения
inline constexpr std::chrono::milliseconds kRecordGrace{3000};

} // namespace

std::string mime_type_for(AudioFormat format) {
  if (format == AudioFormat::Raw) {
    return "audio/L16;rate=" + std::to_string(kAudioSampleRate);
  }
  return "audio/wav";
}

AudioOutcome ArecordAudioSource::record(std::uint64_t max_duration_ms,
                                        AudioFormat format) {
  if (max_duration_ms > kMaxRecordDurationMs) {
    return {AudioResult::CaptureFailed, {}, {},
            "recording of " + std::to_string(max_duration_ms) +
                " ms exceeds the " + std::to_string(kMaxRecordDurationMs) +
                " ms limit"};
  }

  auto exe = resolve_executable("arecord");
  if (!exe) {
    return {AudioResult::RecorderMissing, {}, {},
            "arecord not found in PATH (install alsa-utils)"};
  }

  // -s: число сэмплов на канал, точнее чем -d в секундах
  const std::uint64_t samples = max_duration_ms * kAudioSampleRate / 1000;

  SpawnSpec spec;
  spec.executable = std::move(*exe);
  spec.arguments = {"-q",
                    "-f",
                    "S16_LE",
                    "-r",
                    std::to_string(kAudioSampleRate),
                    "-c",
                    "1",
                    "-t",
                    format == AudioFormat::Raw ? "raw" : "wav",
                    "-s",
                    std::to_string(samples),
                    "-"};
  spec.hidden = true;

  auto launch = run_and_capture(
      spec, {}, ms(max_duration_ms) + kRecordGrace);
  if (!launch.ok()) {
    return {AudioResult::CaptureFailed, {}, {}, launch.error};
  }
  if (launch.exit_code != 0) {
    return {AudioResult::CaptureFailed, {}, {},
            "arecord exited with code " + std::to_string(launch.exit_code)};
  }
  if (launch.output.empty()) {
    return {AudioResult::CaptureFailed, {}, {}, "arecord produced no data"};
  }
  if (launch.truncated) {
    return {AudioResult::CaptureFailed, {}, {},
            "arecord output exceeds " + std::to_string(kMaxCapturedOutput) +
                " bytes"};
  }

  return {AudioResult::Ok, std::move(launch.output), mime_type_for(format), {}};
}

} // namespace hotlaunch
