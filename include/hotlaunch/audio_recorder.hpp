/**
 * @file audio_recorder.hpp
 * @brief Запись звука с микрофона для AI-действий
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "hotlaunch/post_action.hpp"
#include "hotlaunch/process_launcher.hpp"
#include "hotlaunch/types.hpp"

namespace hotlaunch {

/// Параметры записи: 16 kHz, моно, S16_LE
inline constexpr std::uint32_t kAudioSampleRate = 16000;

/// Размер заголовка WAV, который пишет arecord
inline constexpr std::size_t kWavHeaderSize = 44;

/// Самая длинная запись, целиком помещающаяся в перехваченный stdout
inline constexpr std::uint64_t kMaxRecordDurationMs =
    (kMaxCapturedOutput - kWavHeaderSize) / (kAudioSampleRate * 2 / 1000);

/// Результат записи
struct AudioOutcome {
  AudioResult result = AudioResult::Ok;

  /// Байты записи (контейнер WAV или сырой PCM)
  std::string bytes;
  std::string mime_type;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == AudioResult::Ok; }
};

/// MIME-тип для формата записи
[[nodiscard]] std::string mime_type_for(AudioFormat format);

/**
 * @brief Источник звука
 */
class AudioSource {
public:
  virtual ~AudioSource() = default;

  /// Блокирует поток на max_duration_ms
  [[nodiscard]] virtual AudioOutcome record(std::uint64_t max_duration_ms,
                                            AudioFormat format) = 0;
};

/**
 * @brief Запись через arecord (ALSA)
 */
class ArecordAudioSource final : public AudioSource {
public:
  [[nodiscard]] AudioOutcome record(std::uint64_t max_duration_ms,
                                    AudioFormat format) override;
};

} // namespace hotlaunch
