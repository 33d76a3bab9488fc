#ifndef AUDIO_IO_H
#define AUDIO_IO_H

#include <Arduino.h>
#include <functional>
#include <memory>
#include <vector>

// Device-facing audio primitives. The I2S implementations live in
// i2s_audio.h; tests substitute in-memory fakes.

// One playable unit created from a complete container (WAV)
class AudioPlayer {
public:
  virtual ~AudioPlayer() {}

  virtual bool play() = 0;
  virtual void pause() = 0;
  virtual bool isPlaying() const = 0;

  // Invoked once on the loop task when the unit has rendered completely.
  // The output must not touch the player after invoking it.
  virtual void setOnFinished(std::function<void()> callback) = 0;
};

class AudioOutput {
public:
  virtual ~AudioOutput() {}

  // Returns nullptr if the device cannot accept the unit
  virtual std::unique_ptr<AudioPlayer> createPlayer(const std::vector<uint8_t>& container) = 0;

  // true routes to the loudspeaker, false to the earpiece
  virtual bool setRoute(bool speaker) = 0;
};

struct RecordingConfig {
  uint32_t sampleRate;
  uint8_t channels;
  uint16_t intervalMs;  // one chunk per interval
};

class AudioCapture {
public:
  typedef std::function<void(const String& base64Pcm16)> ChunkCallback;

  virtual ~AudioCapture() {}

  // Calling again while recording replaces the callback and keeps the stream
  virtual bool startRecording(const RecordingConfig& config, ChunkCallback onChunk) = 0;
  // Safe when not recording
  virtual void stopRecording() = 0;
  virtual bool isRecording() const = 0;
};

#endif
