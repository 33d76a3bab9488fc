#ifndef I2S_AUDIO_H
#define I2S_AUDIO_H

#include <Arduino.h>
#include <memory>
#include <vector>
#include "audio_codec.h"
#include "audio_io.h"
#include "config.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/ringbuf.h"
#include "freertos/task.h"
#include <driver/i2s.h>

// Production FreeRTOS priorities for audio
#define AUDIO_CAPTURE_PRIORITY   (configMAX_PRIORITIES - 2)
#define AUDIO_PLAYBACK_PRIORITY  (configMAX_PRIORITIES - 3)

#define CAPTURE_RING_BYTES   (16 * 1024)
#define PLAYBACK_QUEUE_DEPTH 4
#define I2S_WRITE_CHUNK      1024

// Rendering state shared between a player and the writer task
struct PlayJob {
  std::vector<uint8_t> pcm;
  uint32_t sampleRate;
  volatile bool aborted;
  volatile bool done;
};

class I2SAudioOutput;

class I2SPlayer : public AudioPlayer {
public:
  I2SPlayer(I2SAudioOutput& output, std::shared_ptr<PlayJob> job);
  ~I2SPlayer();

  bool play() override;
  void pause() override;
  bool isPlaying() const override { return playing; }
  void setOnFinished(std::function<void()> callback) override { onFinished = callback; }

private:
  friend class I2SAudioOutput;

  I2SAudioOutput& output;
  std::shared_ptr<PlayJob> job;
  std::function<void()> onFinished;
  bool playing;

  void notifyFinished();
};

// MAX98357-style amplifier on I2S port 0. Units are written by one FreeRTOS
// task in queue order; completions are delivered from service() on loop().
class I2SAudioOutput : public AudioOutput {
public:
  I2SAudioOutput();
  ~I2SAudioOutput();

  bool begin();
  void end();

  std::unique_ptr<AudioPlayer> createPlayer(const std::vector<uint8_t>& container) override;
  bool setRoute(bool speaker) override;

  // Dispatches completion callbacks; call from loop()
  void service();

private:
  friend class I2SPlayer;

  QueueHandle_t jobQueue;
  TaskHandle_t writerTask;
  std::vector<I2SPlayer*> rendering;
  bool initialized;

  bool submit(I2SPlayer* player);
  void forget(I2SPlayer* player);

  static void writerTaskEntry(void* param);
};

// INMP441-style microphone on I2S port 1. The capture task fills a ring
// buffer; service() slices it into interval-sized base64 PCM16 chunks.
class I2SMicCapture : public AudioCapture {
public:
  I2SMicCapture();
  ~I2SMicCapture();

  bool startRecording(const RecordingConfig& config, ChunkCallback onChunk) override;
  void stopRecording() override;
  bool isRecording() const override { return recording; }

  // Delivers completed chunks; call from loop()
  void service();

  uint32_t getDroppedBytes() const { return droppedBytes; }

private:
  RingbufHandle_t ring;
  TaskHandle_t captureTask;
  ChunkCallback onChunk;
  RecordingConfig config;
  std::vector<uint8_t> pending;
  size_t chunkBytes;
  volatile bool running;
  volatile bool taskExited;
  volatile uint32_t droppedBytes;
  bool recording;

  static void captureTaskEntry(void* param);
};

#endif
