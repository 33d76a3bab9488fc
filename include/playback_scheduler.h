#ifndef PLAYBACK_SCHEDULER_H
#define PLAYBACK_SCHEDULER_H

#include <Arduino.h>
#include <deque>
#include <functional>
#include <memory>
#include <vector>
#include "audio_codec.h"
#include "audio_io.h"
#include "config.h"
#include "timer_queue.h"

struct PlaybackStats {
  uint32_t unitsFlushed;
  uint32_t unitsPlayed;
  uint32_t playbackErrors;
  uint32_t pendingUnits;     // queued plus pre-loaded
  size_t accumulatedBytes;
};

// Turns streamed PCM16 deltas into gapless playback.
//
// Chunks accumulate until either the byte threshold is reached (flush now)
// or no chunk has arrived for the flush timeout. Each flush produces one WAV
// unit. Two player slots alternate: while one renders, the next unit is
// already created in the other, so the hand-off on completion is immediate.
//
// The scheduler is owned by the firmware and lent to one call at a time:
// reset() activates it, destroy() makes it inert until the next reset().
class PlaybackScheduler {
public:
  typedef std::function<void(bool aiSpeaking)> SpeakingCallback;

  PlaybackScheduler(AudioOutput& output, TimerQueue& timers,
                    size_t flushThresholdBytes = VB_PLAYBACK_FLUSH_THRESHOLD,
                    unsigned long flushTimeoutMs = VB_PLAYBACK_FLUSH_TIMEOUT_MS,
                    uint32_t sampleRate = VB_NETWORK_SAMPLE_RATE);
  ~PlaybackScheduler();

  void enqueue(const uint8_t* pcm, size_t length);
  bool enqueue(const AudioChunk& chunk);
  bool enqueueBase64(const String& base64Pcm16);

  // Barge-in: drops everything buffered or playing. Safe at any time.
  void flush();

  void destroy();
  void reset();
  bool isActive() const { return !destroyed; }

  bool isAiSpeaking() const { return aiSpeaking; }
  void setOnAiSpeakingChange(SpeakingCallback callback);

  PlaybackStats getStats() const;

private:
  AudioOutput& output;
  TimerQueue& timers;
  size_t flushThreshold;
  unsigned long flushTimeout;
  uint32_t sampleRate;

  std::vector<uint8_t> accumulation;
  std::deque<std::vector<uint8_t> > queue;
  std::unique_ptr<AudioPlayer> slots[2];
  std::vector<std::unique_ptr<AudioPlayer> > retired;
  int activeSlot;
  int preloadedSlot;
  uint32_t generation;  // bumped by flush(); stale completions are ignored
  TimerToken flushTimer;

  bool destroyed;
  bool aiSpeaking;
  SpeakingCallback onAiSpeakingChange;

  uint32_t unitsFlushed;
  uint32_t unitsPlayed;
  uint32_t playbackErrors;

  void flushBuffer();
  void playNext();
  void preloadNext();
  bool loadSlot(int slot);
  void retire(int slot);
  void onUnitFinished(uint32_t unitGeneration, int slot);
  void setAiSpeaking(bool speaking);
};

#endif
