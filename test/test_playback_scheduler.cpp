#include <unity.h>
#include <Arduino.h>
#include <vector>
#include "encoding_service.h"
#include "fakes.h"
#include "playback_scheduler.h"
#include "timer_queue.h"

static std::vector<uint8_t> silence(size_t bytes) {
  return std::vector<uint8_t>(bytes, 0);
}

struct SchedulerFixture {
  std::vector<bool> speakingChanges;
  FakeAudioOutput output;
  TimerQueue timers;
  PlaybackScheduler scheduler;

  SchedulerFixture() : scheduler(output, timers, 9600, 150, VB_NETWORK_SAMPLE_RATE) {
    scheduler.reset();
    scheduler.setOnAiSpeakingChange([this](bool speaking) { speakingChanges.push_back(speaking); });
  }

  void feed(size_t bytes) {
    std::vector<uint8_t> pcm = silence(bytes);
    scheduler.enqueue(pcm.data(), pcm.size());
  }
};

void test_threshold_flush_starts_playback_synchronously() {
  SchedulerFixture f;

  f.feed(4000);
  f.feed(4000);
  TEST_ASSERT_EQUAL(0, f.output.created);

  f.feed(4000);
  TEST_ASSERT_EQUAL(1, f.output.created);
  TEST_ASSERT_EQUAL(1, f.output.played);
  TEST_ASSERT_EQUAL(12000 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);
  TEST_ASSERT_EQUAL(0, f.timers.pendingCount());

  TEST_ASSERT_TRUE(f.scheduler.isAiSpeaking());
  TEST_ASSERT_EQUAL(1, f.speakingChanges.size());
  TEST_ASSERT_TRUE(f.speakingChanges[0]);
}

void test_quiet_stream_flushes_after_timeout() {
  SchedulerFixture f;

  f.feed(4000);
  f.timers.poll(149);
  TEST_ASSERT_EQUAL(0, f.output.created);

  f.timers.poll(150);
  TEST_ASSERT_EQUAL(1, f.output.created);
  TEST_ASSERT_EQUAL(4000 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);
}

void test_each_chunk_restarts_the_timeout() {
  SchedulerFixture f;

  f.feed(1000);
  f.timers.poll(100);
  f.feed(1000);
  f.timers.poll(200);
  TEST_ASSERT_EQUAL(0, f.output.created);

  f.timers.poll(250);
  TEST_ASSERT_EQUAL(1, f.output.created);
  TEST_ASSERT_EQUAL(2000 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);
}

void test_next_unit_is_preloaded_and_handed_off() {
  SchedulerFixture f;

  f.feed(9600);
  f.feed(9600);
  TEST_ASSERT_EQUAL(2, f.output.created);
  TEST_ASSERT_EQUAL(1, f.output.played);
  TEST_ASSERT_EQUAL(1, f.scheduler.getStats().pendingUnits);

  FakePlayer* first = f.output.playing();
  TEST_ASSERT_EQUAL(1, first->id);

  TEST_ASSERT_TRUE(f.output.finishCurrent());
  TEST_ASSERT_EQUAL(2, f.output.played);
  TEST_ASSERT_EQUAL(2, f.output.playing()->id);
  TEST_ASSERT_EQUAL(1, f.output.playingCount());
  // No gap reported between units
  TEST_ASSERT_EQUAL(1, f.speakingChanges.size());

  TEST_ASSERT_TRUE(f.output.finishCurrent());
  TEST_ASSERT_FALSE(f.scheduler.isAiSpeaking());
  TEST_ASSERT_EQUAL(2, f.speakingChanges.size());
  TEST_ASSERT_FALSE(f.speakingChanges[1]);
  TEST_ASSERT_EQUAL(2, f.scheduler.getStats().unitsPlayed);
}

void test_units_play_in_arrival_order() {
  SchedulerFixture f;

  f.feed(9600);
  f.feed(9601);
  f.feed(9602);
  TEST_ASSERT_EQUAL(9600 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);

  f.output.finishCurrent();
  TEST_ASSERT_EQUAL(9601 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);

  f.output.finishCurrent();
  TEST_ASSERT_EQUAL(9602 + VB_WAV_HEADER_SIZE, f.output.playing()->bytes);
}

void test_flush_stops_everything_and_is_idempotent() {
  SchedulerFixture f;

  f.feed(9600);
  f.feed(9600);
  f.feed(2000);
  TEST_ASSERT_EQUAL(1, f.timers.pendingCount());

  f.scheduler.flush();
  TEST_ASSERT_EQUAL(1, f.output.paused);
  TEST_ASSERT_EQUAL(0, f.output.playingCount());
  TEST_ASSERT_FALSE(f.scheduler.isAiSpeaking());
  TEST_ASSERT_EQUAL(0, f.timers.pendingCount());
  TEST_ASSERT_EQUAL(0, f.scheduler.getStats().pendingUnits);
  TEST_ASSERT_EQUAL(0, f.scheduler.getStats().accumulatedBytes);
  TEST_ASSERT_EQUAL(2, f.speakingChanges.size());

  f.scheduler.flush();
  TEST_ASSERT_EQUAL(1, f.output.paused);
  TEST_ASSERT_EQUAL(2, f.speakingChanges.size());

  f.timers.poll(1000);
  TEST_ASSERT_EQUAL(2, f.output.created);
}

void test_completion_from_before_flush_is_ignored() {
  SchedulerFixture f;

  f.feed(9600);
  FakePlayer* stale = f.output.playing();
  f.scheduler.flush();

  stale->finish();
  TEST_ASSERT_EQUAL(0, f.scheduler.getStats().unitsPlayed);
  TEST_ASSERT_EQUAL(1, f.output.played);
  TEST_ASSERT_FALSE(f.scheduler.isAiSpeaking());

  f.feed(9600);
  TEST_ASSERT_EQUAL(2, f.output.played);
  TEST_ASSERT_TRUE(f.scheduler.isAiSpeaking());
}

void test_rejected_unit_is_skipped() {
  SchedulerFixture f;

  f.output.failCreate = true;
  f.feed(9600);
  TEST_ASSERT_EQUAL(1, f.scheduler.getStats().playbackErrors);
  TEST_ASSERT_FALSE(f.scheduler.isAiSpeaking());
  TEST_ASSERT_EQUAL(0, f.speakingChanges.size());

  f.output.failCreate = false;
  f.feed(9600);
  TEST_ASSERT_EQUAL(1, f.output.played);
  TEST_ASSERT_TRUE(f.scheduler.isAiSpeaking());
}

void test_unit_that_fails_to_start_is_skipped() {
  SchedulerFixture f;

  f.output.failPlay = true;
  f.feed(9600);
  TEST_ASSERT_EQUAL(1, f.output.created);
  TEST_ASSERT_EQUAL(1, f.scheduler.getStats().playbackErrors);
  TEST_ASSERT_FALSE(f.scheduler.isAiSpeaking());

  f.output.failPlay = false;
  f.feed(9600);
  TEST_ASSERT_TRUE(f.scheduler.isAiSpeaking());
}

void test_base64_delta_is_decoded_before_buffering() {
  SchedulerFixture f;

  std::vector<uint8_t> pcm = silence(4800);
  TEST_ASSERT_TRUE(f.scheduler.enqueueBase64(encodeBase64ToString(pcm)));
  TEST_ASSERT_EQUAL(4800, f.scheduler.getStats().accumulatedBytes);

  TEST_ASSERT_FALSE(f.scheduler.enqueueBase64(""));
  TEST_ASSERT_EQUAL(4800, f.scheduler.getStats().accumulatedBytes);
}

void test_telephony_chunk_is_converted_to_network_rate() {
  SchedulerFixture f;

  AudioChunk chunk;
  chunk.data = std::vector<uint8_t>(160, 0xFF);
  chunk.sampleRate = VB_TELEPHONY_SAMPLE_RATE;
  chunk.channels = 1;
  chunk.encoding = AUDIO_MULAW;
  TEST_ASSERT_TRUE(f.scheduler.enqueue(chunk));
  TEST_ASSERT_EQUAL(160 * 3 * 2, f.scheduler.getStats().accumulatedBytes);

  chunk.channels = 2;
  TEST_ASSERT_FALSE(f.scheduler.enqueue(chunk));

  chunk.channels = 1;
  chunk.encoding = AUDIO_PCM16;
  chunk.sampleRate = 16000;
  TEST_ASSERT_FALSE(f.scheduler.enqueue(chunk));
}

void test_destroyed_scheduler_is_inert() {
  FakeAudioOutput output;
  TimerQueue timers;
  PlaybackScheduler scheduler(output, timers);
  TEST_ASSERT_FALSE(scheduler.isActive());

  std::vector<uint8_t> pcm = silence(VB_PLAYBACK_FLUSH_THRESHOLD);
  scheduler.enqueue(pcm.data(), pcm.size());
  TEST_ASSERT_EQUAL(0, output.created);

  scheduler.reset();
  TEST_ASSERT_TRUE(scheduler.isActive());
  scheduler.enqueue(pcm.data(), pcm.size());
  TEST_ASSERT_EQUAL(1, output.played);
  FakePlayer* player = output.playing();

  scheduler.destroy();
  TEST_ASSERT_FALSE(scheduler.isActive());
  TEST_ASSERT_FALSE(scheduler.isAiSpeaking());
  TEST_ASSERT_EQUAL(1, output.paused);

  player->finish();
  scheduler.enqueue(pcm.data(), pcm.size());
  TEST_ASSERT_EQUAL(1, output.created);
  TEST_ASSERT_FALSE(scheduler.enqueueBase64(encodeBase64ToString(pcm)));

  // Second destroy is harmless
  scheduler.destroy();
  TEST_ASSERT_EQUAL(1, output.paused);
}

#ifndef UNIT_TEST
void setup() {
  delay(2000);
  UNITY_BEGIN();
  RUN_TEST(test_threshold_flush_starts_playback_synchronously);
  RUN_TEST(test_quiet_stream_flushes_after_timeout);
  RUN_TEST(test_each_chunk_restarts_the_timeout);
  RUN_TEST(test_next_unit_is_preloaded_and_handed_off);
  RUN_TEST(test_units_play_in_arrival_order);
  RUN_TEST(test_flush_stops_everything_and_is_idempotent);
  RUN_TEST(test_completion_from_before_flush_is_ignored);
  RUN_TEST(test_rejected_unit_is_skipped);
  RUN_TEST(test_unit_that_fails_to_start_is_skipped);
  RUN_TEST(test_base64_delta_is_decoded_before_buffering);
  RUN_TEST(test_telephony_chunk_is_converted_to_network_rate);
  RUN_TEST(test_destroyed_scheduler_is_inert);
  UNITY_END();
}

void loop() {

}
#endif
