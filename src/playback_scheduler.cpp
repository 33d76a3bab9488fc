#include "playback_scheduler.h"
#include "encoding_service.h"
#include "production_logger.h"

PlaybackScheduler::PlaybackScheduler(AudioOutput& output, TimerQueue& timers,
                                     size_t flushThresholdBytes, unsigned long flushTimeoutMs,
                                     uint32_t sampleRate)
  : output(output),
    timers(timers),
    flushThreshold(flushThresholdBytes),
    flushTimeout(flushTimeoutMs),
    sampleRate(sampleRate),
    activeSlot(-1),
    preloadedSlot(-1),
    generation(0),
    flushTimer(VB_NO_TIMER),
    destroyed(true),
    aiSpeaking(false),
    unitsFlushed(0),
    unitsPlayed(0),
    playbackErrors(0) {
  accumulation.reserve(flushThreshold);
}

PlaybackScheduler::~PlaybackScheduler() {
  timers.cancel(flushTimer);
  onAiSpeakingChange = nullptr;
  for (int i = 0; i < 2; i++) {
    if (slots[i]) slots[i]->pause();
  }
}

void PlaybackScheduler::enqueue(const uint8_t* pcm, size_t length) {
  if (destroyed || pcm == nullptr || length == 0) return;
  retired.clear();

  accumulation.insert(accumulation.end(), pcm, pcm + length);
  timers.cancel(flushTimer);

  if (accumulation.size() >= flushThreshold) {
    flushBuffer();
  } else {
    flushTimer = timers.schedule(flushTimeout, [this]() {
      flushTimer = VB_NO_TIMER;
      flushBuffer();
    });
  }
}

bool PlaybackScheduler::enqueue(const AudioChunk& chunk) {
  if (chunk.channels != 1) {
    VB_LOG_WARNING(LOG_AUDIO, "Dropping non-mono chunk", "channels=" + String(chunk.channels));
    return false;
  }

  if (chunk.encoding == AUDIO_MULAW && chunk.sampleRate * VB_RESAMPLE_FACTOR == sampleRate) {
    std::vector<uint8_t> pcm = pcm16ToBytes(downlinkToNetwork(chunk.data));
    enqueue(pcm.data(), pcm.size());
    return true;
  }
  if (chunk.encoding == AUDIO_PCM16 && chunk.sampleRate == sampleRate) {
    enqueue(chunk.data.data(), chunk.data.size());
    return true;
  }

  VB_LOG_WARNING(LOG_AUDIO, "Dropping chunk with unsupported format", "rate=" + String(chunk.sampleRate));
  return false;
}

bool PlaybackScheduler::enqueueBase64(const String& base64Pcm16) {
  if (destroyed) return false;

  std::vector<uint8_t> pcm = decodeBase64ToVector(base64Pcm16);
  if (pcm.empty()) {
    VB_LOG_WARNING(LOG_AUDIO, "Dropping undecodable audio delta", "length=" + String(base64Pcm16.length()));
    return false;
  }
  enqueue(pcm.data(), pcm.size());
  return true;
}

void PlaybackScheduler::flushBuffer() {
  if (accumulation.empty()) return;

  queue.push_back(buildWavContainer(accumulation, sampleRate, 1));
  accumulation.clear();
  unitsFlushed++;

  if (activeSlot < 0) {
    playNext();
  } else {
    preloadNext();
  }
}

bool PlaybackScheduler::loadSlot(int slot) {
  std::vector<uint8_t> unit;
  unit.swap(queue.front());
  queue.pop_front();

  std::unique_ptr<AudioPlayer> player = output.createPlayer(unit);
  if (!player) {
    playbackErrors++;
    VB_LOG_ERROR(LOG_AUDIO, "Output rejected playback unit, skipping", "bytes=" + String(unit.size()));
    return false;
  }

  uint32_t unitGeneration = generation;
  player->setOnFinished([this, unitGeneration, slot]() {
    onUnitFinished(unitGeneration, slot);
  });
  slots[slot] = std::move(player);
  return true;
}

void PlaybackScheduler::playNext() {
  while (true) {
    int slot;
    if (preloadedSlot >= 0) {
      slot = preloadedSlot;
      preloadedSlot = -1;
    } else {
      if (queue.empty()) {
        activeSlot = -1;
        setAiSpeaking(false);
        return;
      }
      slot = 0;
      if (!loadSlot(slot)) continue;
    }

    if (!slots[slot]->play()) {
      playbackErrors++;
      VB_LOG_ERROR(LOG_AUDIO, "Playback start failed, skipping unit");
      retire(slot);
      continue;
    }

    activeSlot = slot;
    setAiSpeaking(true);
    preloadNext();
    return;
  }
}

void PlaybackScheduler::preloadNext() {
  while (activeSlot >= 0 && preloadedSlot < 0 && !queue.empty()) {
    int slot = 1 - activeSlot;
    if (loadSlot(slot)) {
      preloadedSlot = slot;
    }
  }
}

void PlaybackScheduler::retire(int slot) {
  if (slots[slot]) {
    retired.push_back(std::move(slots[slot]));
  }
}

void PlaybackScheduler::onUnitFinished(uint32_t unitGeneration, int slot) {
  if (destroyed || unitGeneration != generation || slot != activeSlot) return;

  // Players retired earlier are no longer on the call stack
  retired.clear();

  unitsPlayed++;
  retire(slot);
  activeSlot = -1;
  playNext();
}

void PlaybackScheduler::flush() {
  timers.cancel(flushTimer);
  accumulation.clear();
  queue.clear();
  generation++;

  for (int i = 0; i < 2; i++) {
    if (slots[i]) {
      slots[i]->pause();
      retire(i);
    }
  }
  activeSlot = -1;
  preloadedSlot = -1;
  setAiSpeaking(false);
}

void PlaybackScheduler::destroy() {
  if (destroyed) return;
  destroyed = true;
  flush();
  onAiSpeakingChange = nullptr;
  VB_LOG_DEBUG(LOG_AUDIO, "Playback scheduler released",
               "flushed=" + String(unitsFlushed) + " played=" + String(unitsPlayed));
}

void PlaybackScheduler::reset() {
  timers.cancel(flushTimer);
  accumulation.clear();
  queue.clear();
  retired.clear();
  for (int i = 0; i < 2; i++) {
    if (slots[i]) {
      slots[i]->pause();
      slots[i].reset();
    }
  }
  generation++;
  activeSlot = -1;
  preloadedSlot = -1;
  aiSpeaking = false;
  unitsFlushed = 0;
  unitsPlayed = 0;
  playbackErrors = 0;
  destroyed = false;
}

void PlaybackScheduler::setOnAiSpeakingChange(SpeakingCallback callback) {
  onAiSpeakingChange = callback;
}

void PlaybackScheduler::setAiSpeaking(bool speaking) {
  if (aiSpeaking == speaking) return;
  aiSpeaking = speaking;
  if (onAiSpeakingChange) {
    SpeakingCallback callback = onAiSpeakingChange;
    callback(speaking);
  }
}

PlaybackStats PlaybackScheduler::getStats() const {
  PlaybackStats stats;
  stats.unitsFlushed = unitsFlushed;
  stats.unitsPlayed = unitsPlayed;
  stats.playbackErrors = playbackErrors;
  stats.pendingUnits = queue.size() + (preloadedSlot >= 0 ? 1 : 0);
  stats.accumulatedBytes = accumulation.size();
  return stats;
}
