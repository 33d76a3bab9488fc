#include <unity.h>
#include <Arduino.h>
#include <vector>
#include "encoding_service.h"
#include "fakes.h"
#include "playback_scheduler.h"
#include "timer_queue.h"
#include "voice_session.h"

#define TEST_REALTIME_URL "wss://api.x.ai/v1/realtime"

class RecordingListener : public SessionListener {
public:
  RecordingListener() : failed(0), ended(0) {}

  void onPhaseChanged(SessionPhase phase) override { phases.push_back(phase); }
  void onUserSpeakingChanged(bool speaking) override { userSpeaking.push_back(speaking); }
  void onAiSpeakingChanged(bool speaking) override { aiSpeaking.push_back(speaking); }
  void onTranscriptEntry(const TranscriptEntry& entry) override { entries.push_back(entry); }
  void onCallFailed() override { failed++; }
  void onCallEnded(const std::vector<TranscriptEntry>& transcript) override {
    ended++;
    endedTranscript = transcript;
  }

  std::vector<SessionPhase> phases;
  std::vector<bool> userSpeaking;
  std::vector<bool> aiSpeaking;
  std::vector<TranscriptEntry> entries;
  std::vector<TranscriptEntry> endedTranscript;
  int failed;
  int ended;
};

struct CallFixture {
  FakeTransport transport;
  FakeCapture capture;
  FakeAudioOutput output;
  TimerQueue timers;
  PlaybackScheduler playback;
  FakeCredentialProvider credentials;
  RecordingListener listener;
  VoiceSession session;

  CallFixture()
    : playback(output, timers),
      session(transport, capture, output, playback, credentials, timers, TEST_REALTIME_URL) {
    session.setListener(&listener);
  }

  void connect() {
    TEST_ASSERT_EQUAL(START_OK, session.startCall("ws_1", "agent_1"));
    transport.accept();
  }

  void receive(const String& message) {
    transport.deliver(message);
  }

  void advanceTo(unsigned long ms) {
    timers.poll(ms);
  }
};

static String audioDelta(size_t bytes) {
  std::vector<uint8_t> pcm(bytes, 0);
  return "{\"type\":\"response.audio.delta\",\"delta\":\"" + encodeBase64ToString(pcm) + "\"}";
}

static const char* SPEECH_STARTED = "{\"type\":\"input_audio_buffer.speech_started\"}";
static const char* SPEECH_STOPPED = "{\"type\":\"input_audio_buffer.speech_stopped\"}";

// ---------------------------------------------------------------------------
// Transition table

void test_transition_table() {
  TEST_ASSERT_EQUAL(PHASE_CONNECTING, VoiceSession::nextPhase(PHASE_IDLE, SESSION_EV_CALL_STARTED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_CONNECTING, VoiceSession::nextPhase(PHASE_FAILED, SESSION_EV_CALL_STARTED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_OPEN, VoiceSession::nextPhase(PHASE_OPEN, SESSION_EV_CALL_STARTED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_OPEN, VoiceSession::nextPhase(PHASE_CONNECTING, SESSION_EV_TRANSPORT_OPENED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_IDLE, VoiceSession::nextPhase(PHASE_CONNECTING, SESSION_EV_START_ABORTED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_RECONNECTING, VoiceSession::nextPhase(PHASE_OPEN, SESSION_EV_TRANSPORT_LOST, 4, 5));
  TEST_ASSERT_EQUAL(PHASE_FAILED, VoiceSession::nextPhase(PHASE_OPEN, SESSION_EV_TRANSPORT_LOST, 5, 5));
  TEST_ASSERT_EQUAL(PHASE_RECONNECTING, VoiceSession::nextPhase(PHASE_CONNECTING, SESSION_EV_TRANSPORT_LOST, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_IDLE, VoiceSession::nextPhase(PHASE_IDLE, SESSION_EV_TRANSPORT_LOST, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_CONNECTING, VoiceSession::nextPhase(PHASE_RECONNECTING, SESSION_EV_RECONNECT_DUE, 1, 5));
  TEST_ASSERT_EQUAL(PHASE_CLOSING, VoiceSession::nextPhase(PHASE_RECONNECTING, SESSION_EV_END_REQUESTED, 1, 5));
  TEST_ASSERT_EQUAL(PHASE_IDLE, VoiceSession::nextPhase(PHASE_IDLE, SESSION_EV_END_REQUESTED, 0, 5));
  TEST_ASSERT_EQUAL(PHASE_IDLE, VoiceSession::nextPhase(PHASE_CLOSING, SESSION_EV_TEARDOWN_COMPLETE, 0, 5));
}

void test_reconnect_delay_doubles() {
  TEST_ASSERT_EQUAL_UINT32(1000, VoiceSession::reconnectDelayMs(1000, 0));
  TEST_ASSERT_EQUAL_UINT32(2000, VoiceSession::reconnectDelayMs(1000, 1));
  TEST_ASSERT_EQUAL_UINT32(16000, VoiceSession::reconnectDelayMs(1000, 4));
  TEST_ASSERT_EQUAL_UINT32(1000, VoiceSession::reconnectDelayMs(1000, -3));
}

// ---------------------------------------------------------------------------
// Start and rollback

void test_start_call_acquires_resources_in_order() {
  CallFixture f;

  TEST_ASSERT_EQUAL(START_OK, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_CONNECTING, f.session.getPhase());
  TEST_ASSERT_EQUAL(1, f.credentials.requests);
  TEST_ASSERT_EQUAL_STRING("ws_1", f.credentials.lastWorkspace.c_str());
  TEST_ASSERT_EQUAL_STRING("agent_1", f.credentials.lastAgent.c_str());

  TEST_ASSERT_TRUE(f.capture.recording);
  TEST_ASSERT_EQUAL_UINT32(24000, f.capture.lastConfig.sampleRate);
  TEST_ASSERT_EQUAL_UINT8(1, f.capture.lastConfig.channels);
  TEST_ASSERT_EQUAL_UINT16(100, f.capture.lastConfig.intervalMs);

  TEST_ASSERT_EQUAL(1, f.transport.opens);
  TEST_ASSERT_EQUAL_STRING(TEST_REALTIME_URL, f.transport.lastUrl.c_str());
  TEST_ASSERT_EQUAL_STRING("ephemeral-token", f.transport.lastToken.c_str());

  TEST_ASSERT_FALSE(f.output.speaker);
  TEST_ASSERT_TRUE(f.playback.isActive());
  TEST_ASSERT_TRUE(f.session.isInCall());
}

void test_open_sends_session_update_then_greeting() {
  CallFixture f;
  f.connect();

  TEST_ASSERT_EQUAL(PHASE_OPEN, f.session.getPhase());
  TEST_ASSERT_EQUAL(3, f.transport.sent.size());
  TEST_ASSERT_TRUE(f.transport.sent[0].indexOf("\"session.update\"") >= 0);
  TEST_ASSERT_TRUE(f.transport.sent[0].indexOf("\"Ara\"") >= 0);
  TEST_ASSERT_TRUE(f.transport.sent[1].indexOf("conversation.item.create") >= 0);
  TEST_ASSERT_TRUE(f.transport.sent[1].indexOf("Thanks for calling") >= 0);
  TEST_ASSERT_TRUE(f.transport.sent[2].indexOf("response.create") >= 0);
}

void test_agent_without_greeting_waits_for_caller() {
  CallFixture f;
  f.credentials.grant.agent.initialGreeting = "";
  f.connect();

  TEST_ASSERT_EQUAL(1, f.transport.sent.size());
  TEST_ASSERT_EQUAL(0, f.transport.countSent("response.create"));
}

void test_route_failure_aborts_before_credentials() {
  CallFixture f;
  f.output.failRoute = true;

  TEST_ASSERT_EQUAL(START_ERR_OUTPUT, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.credentials.requests);
  TEST_ASSERT_FALSE(f.playback.isActive());
}

void test_credential_failure_allocates_nothing() {
  CallFixture f;
  f.credentials.fail = true;

  TEST_ASSERT_EQUAL(START_ERR_CREDENTIAL, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.capture.starts);
  TEST_ASSERT_EQUAL(0, f.transport.opens);
  TEST_ASSERT_FALSE(f.playback.isActive());

  TEST_ASSERT_EQUAL(2, f.listener.phases.size());
  TEST_ASSERT_EQUAL(PHASE_CONNECTING, f.listener.phases[0]);
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.listener.phases[1]);
}

void test_capture_failure_rolls_back() {
  CallFixture f;
  f.capture.failStart = true;

  TEST_ASSERT_EQUAL(START_ERR_CAPTURE, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.transport.opens);
  TEST_ASSERT_FALSE(f.playback.isActive());
  TEST_ASSERT_EQUAL_STRING("", f.session.getState().token.c_str());
}

void test_transport_failure_stops_capture_and_allows_retry() {
  CallFixture f;
  f.transport.failOpen = true;

  TEST_ASSERT_EQUAL(START_ERR_TRANSPORT, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_FALSE(f.capture.recording);
  TEST_ASSERT_EQUAL(1, f.capture.stops);
  TEST_ASSERT_FALSE(f.playback.isActive());

  f.transport.failOpen = false;
  TEST_ASSERT_EQUAL(START_OK, f.session.startCall("ws_1", "agent_1"));
}

void test_second_start_is_rejected_while_busy() {
  CallFixture f;
  f.connect();

  TEST_ASSERT_EQUAL(START_ERR_BUSY, f.session.startCall("ws_2", "agent_2"));
  TEST_ASSERT_EQUAL(1, f.credentials.requests);
  TEST_ASSERT_EQUAL(PHASE_OPEN, f.session.getPhase());
}

void test_start_is_rejected_while_playback_is_held() {
  CallFixture f;
  f.playback.reset();

  TEST_ASSERT_EQUAL(START_ERR_BUSY, f.session.startCall("ws_1", "agent_1"));
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.credentials.requests);
}

// ---------------------------------------------------------------------------
// Streaming

void test_capture_is_sent_only_when_open_and_unmuted() {
  CallFixture f;

  TEST_ASSERT_EQUAL(START_OK, f.session.startCall("ws_1", "agent_1"));
  f.capture.emit("AAAA");
  TEST_ASSERT_EQUAL(0, f.transport.sent.size());

  f.transport.accept();
  f.capture.emit("AAAA");
  TEST_ASSERT_EQUAL(1, f.transport.countSent("input_audio_buffer.append"));

  TEST_ASSERT_TRUE(f.session.toggleMute());
  f.capture.emit("BBBB");
  TEST_ASSERT_EQUAL(1, f.transport.countSent("input_audio_buffer.append"));
  // Mute keeps the microphone running
  TEST_ASSERT_TRUE(f.capture.recording);

  TEST_ASSERT_FALSE(f.session.toggleMute());
  f.capture.emit("CCCC");
  TEST_ASSERT_EQUAL(2, f.transport.countSent("input_audio_buffer.append"));
  TEST_ASSERT_TRUE(f.transport.sent.back().indexOf("CCCC") >= 0);
}

void test_audio_delta_reaches_playback() {
  CallFixture f;
  f.connect();

  f.receive(audioDelta(VB_PLAYBACK_FLUSH_THRESHOLD));
  TEST_ASSERT_EQUAL(1, f.output.played);
  TEST_ASSERT_TRUE(f.session.getState().aiSpeaking);
  TEST_ASSERT_EQUAL(1, f.listener.aiSpeaking.size());
  TEST_ASSERT_TRUE(f.listener.aiSpeaking[0]);
}

void test_malformed_message_keeps_session_open() {
  CallFixture f;
  f.connect();

  f.receive("{\"type\":");
  f.receive("{\"type\":\"rate_limits.updated\"}");
  TEST_ASSERT_EQUAL(PHASE_OPEN, f.session.getPhase());
}

void test_toggle_speaker_follows_route_result() {
  CallFixture f;
  f.connect();

  TEST_ASSERT_TRUE(f.session.toggleSpeaker());
  TEST_ASSERT_TRUE(f.output.speaker);

  f.output.failRoute = true;
  TEST_ASSERT_TRUE(f.session.toggleSpeaker());
  TEST_ASSERT_TRUE(f.output.speaker);
  TEST_ASSERT_TRUE(f.session.getState().speakerOn);
}

// ---------------------------------------------------------------------------
// Voice activity

void test_reversed_signal_within_window_does_not_flicker() {
  CallFixture f;
  f.connect();

  f.receive(SPEECH_STARTED);
  f.advanceTo(50);
  f.receive(SPEECH_STOPPED);
  f.advanceTo(100);
  f.receive(SPEECH_STARTED);

  f.advanceTo(199);
  TEST_ASSERT_FALSE(f.session.getState().userSpeaking);
  f.advanceTo(200);
  TEST_ASSERT_TRUE(f.session.getState().userSpeaking);

  f.advanceTo(2000);
  TEST_ASSERT_EQUAL(1, f.listener.userSpeaking.size());
  TEST_ASSERT_TRUE(f.listener.userSpeaking[0]);
}

void test_pause_shorter_than_stop_window_keeps_speaking() {
  CallFixture f;
  f.connect();

  f.receive(SPEECH_STARTED);
  f.advanceTo(100);
  TEST_ASSERT_TRUE(f.session.getState().userSpeaking);

  f.advanceTo(300);
  f.receive(SPEECH_STOPPED);
  f.advanceTo(400);
  f.receive(SPEECH_STARTED);
  f.advanceTo(1000);
  TEST_ASSERT_TRUE(f.session.getState().userSpeaking);

  f.receive(SPEECH_STOPPED);
  f.advanceTo(1499);
  TEST_ASSERT_TRUE(f.session.getState().userSpeaking);
  f.advanceTo(1500);
  TEST_ASSERT_FALSE(f.session.getState().userSpeaking);
  TEST_ASSERT_EQUAL(2, f.listener.userSpeaking.size());
}

void test_confirmed_speech_interrupts_agent() {
  CallFixture f;
  f.connect();

  f.receive(audioDelta(VB_PLAYBACK_FLUSH_THRESHOLD));
  f.receive(audioDelta(VB_PLAYBACK_FLUSH_THRESHOLD));
  TEST_ASSERT_TRUE(f.session.getState().aiSpeaking);

  f.receive(SPEECH_STARTED);
  f.advanceTo(99);
  TEST_ASSERT_EQUAL(0, f.output.paused);

  f.advanceTo(100);
  TEST_ASSERT_EQUAL(1, f.output.paused);
  TEST_ASSERT_EQUAL(0, f.output.playingCount());
  TEST_ASSERT_FALSE(f.session.getState().aiSpeaking);
  TEST_ASSERT_TRUE(f.session.getState().userSpeaking);
  TEST_ASSERT_EQUAL(0, f.playback.getStats().pendingUnits);
}

void test_unconfirmed_speech_does_not_interrupt() {
  CallFixture f;
  f.connect();

  f.receive(audioDelta(VB_PLAYBACK_FLUSH_THRESHOLD));
  f.receive(SPEECH_STARTED);
  f.advanceTo(60);
  f.receive(SPEECH_STOPPED);
  f.advanceTo(1000);

  TEST_ASSERT_EQUAL(0, f.output.paused);
  TEST_ASSERT_TRUE(f.session.getState().aiSpeaking);
}

// ---------------------------------------------------------------------------
// Reconnection

void test_reconnect_backoff_until_failed() {
  CallFixture f;
  f.connect();

  for (int attempt = 0; attempt < VB_MAX_RECONNECT_ATTEMPTS; attempt++) {
    int opens = f.transport.opens;
    f.transport.drop();
    TEST_ASSERT_EQUAL(PHASE_RECONNECTING, f.session.getPhase());

    unsigned long due = f.timers.now() + (1000UL << attempt);
    f.advanceTo(due - 1);
    TEST_ASSERT_EQUAL(opens, f.transport.opens);
    f.advanceTo(due);
    TEST_ASSERT_EQUAL(opens + 1, f.transport.opens);
    TEST_ASSERT_EQUAL(PHASE_CONNECTING, f.session.getPhase());
    TEST_ASSERT_EQUAL_STRING("ephemeral-token", f.transport.lastToken.c_str());
  }
  TEST_ASSERT_EQUAL(1, f.credentials.requests);

  f.transport.drop();
  TEST_ASSERT_EQUAL(PHASE_FAILED, f.session.getPhase());
  TEST_ASSERT_EQUAL(1, f.listener.failed);
  TEST_ASSERT_EQUAL(1, f.listener.ended);
  TEST_ASSERT_EQUAL(0, f.timers.pendingCount());
  TEST_ASSERT_FALSE(f.capture.recording);
  TEST_ASSERT_FALSE(f.playback.isActive());

  f.advanceTo(f.timers.now() + 60000);
  TEST_ASSERT_EQUAL(1 + VB_MAX_RECONNECT_ATTEMPTS, f.transport.opens);

  // A failed call can be replaced by a new one
  TEST_ASSERT_EQUAL(START_OK, f.session.startCall("ws_1", "agent_1"));
}

void test_successful_reopen_resets_backoff_without_regreeting() {
  CallFixture f;
  f.connect();

  f.transport.drop();
  f.advanceTo(1000);
  f.transport.accept();
  TEST_ASSERT_EQUAL(PHASE_OPEN, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.session.getState().reconnectAttempt);
  TEST_ASSERT_EQUAL(2, f.transport.countSent("session.update"));
  TEST_ASSERT_EQUAL(1, f.transport.countSent("response.create"));

  f.transport.drop();
  f.advanceTo(1999);
  TEST_ASSERT_EQUAL(2, f.transport.opens);
  f.advanceTo(2000);
  TEST_ASSERT_EQUAL(3, f.transport.opens);
}

void test_end_call_while_reconnecting_cancels_retry() {
  CallFixture f;
  f.connect();

  f.transport.drop();
  f.session.endCall();
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.timers.pendingCount());

  f.advanceTo(60000);
  TEST_ASSERT_EQUAL(1, f.transport.opens);
  TEST_ASSERT_EQUAL(0, f.listener.failed);
}

void test_close_event_after_end_call_is_ignored() {
  CallFixture f;
  f.connect();

  f.session.endCall();
  TEST_ASSERT_EQUAL(1, f.transport.closes);

  f.transport.lateClose();
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.timers.pendingCount());

  f.advanceTo(60000);
  TEST_ASSERT_EQUAL(1, f.transport.opens);
}

void test_repeated_send_failures_force_reconnect() {
  CallFixture f;
  f.connect();

  f.transport.failSend = true;
  f.capture.emit("AAAA");
  f.capture.emit("AAAA");
  TEST_ASSERT_EQUAL(PHASE_OPEN, f.session.getPhase());
  TEST_ASSERT_EQUAL(0, f.transport.closes);

  f.capture.emit("AAAA");
  TEST_ASSERT_EQUAL(1, f.transport.closes);
  TEST_ASSERT_EQUAL(PHASE_RECONNECTING, f.session.getPhase());

  f.transport.failSend = false;
  f.advanceTo(1000);
  TEST_ASSERT_EQUAL(2, f.transport.opens);
}

// ---------------------------------------------------------------------------
// Teardown

void test_end_call_releases_everything_and_hands_over_transcript() {
  CallFixture f;
  f.connect();

  f.advanceTo(1500);
  f.receive("{\"type\":\"conversation.item.input_audio_transcription.completed\",\"transcript\":\"I need an appointment\"}");
  f.advanceTo(2500);
  f.receive("{\"type\":\"response.audio_transcript.done\",\"transcript\":\"Sure, what day works?\"}");
  f.receive("{\"type\":\"response.audio_transcript.done\",\"transcript\":\"\"}");
  TEST_ASSERT_EQUAL(2, f.listener.entries.size());

  f.session.endCall();
  TEST_ASSERT_EQUAL(PHASE_IDLE, f.session.getPhase());
  TEST_ASSERT_FALSE(f.capture.recording);
  TEST_ASSERT_FALSE(f.transport.isOpen());
  TEST_ASSERT_FALSE(f.playback.isActive());

  TEST_ASSERT_EQUAL(1, f.listener.ended);
  TEST_ASSERT_EQUAL(2, f.listener.endedTranscript.size());
  TEST_ASSERT_EQUAL(ROLE_USER, f.listener.endedTranscript[0].role);
  TEST_ASSERT_EQUAL_UINT32(1500, f.listener.endedTranscript[0].timestamp);
  TEST_ASSERT_EQUAL(ROLE_ASSISTANT, f.listener.endedTranscript[1].role);
  TEST_ASSERT_EQUAL_STRING("Sure, what day works?", f.listener.endedTranscript[1].text.c_str());
  TEST_ASSERT_EQUAL_UINT32(2500, f.listener.endedTranscript[1].timestamp);

  f.session.endCall();
  TEST_ASSERT_EQUAL(1, f.listener.ended);
}

void test_end_call_when_idle_is_a_no_op() {
  CallFixture f;
  f.session.endCall();
  TEST_ASSERT_EQUAL(0, f.listener.ended);
  TEST_ASSERT_EQUAL(0, f.listener.phases.size());
}

void test_messages_after_end_call_are_dropped() {
  CallFixture f;
  f.connect();
  f.session.endCall();

  f.receive(audioDelta(VB_PLAYBACK_FLUSH_THRESHOLD));
  f.receive(SPEECH_STARTED);
  f.advanceTo(1000);
  TEST_ASSERT_EQUAL(0, f.output.created);
  TEST_ASSERT_FALSE(f.session.getState().userSpeaking);
}

#ifndef UNIT_TEST
void setup() {
  delay(2000);
  UNITY_BEGIN();
  RUN_TEST(test_transition_table);
  RUN_TEST(test_reconnect_delay_doubles);
  RUN_TEST(test_start_call_acquires_resources_in_order);
  RUN_TEST(test_open_sends_session_update_then_greeting);
  RUN_TEST(test_agent_without_greeting_waits_for_caller);
  RUN_TEST(test_route_failure_aborts_before_credentials);
  RUN_TEST(test_credential_failure_allocates_nothing);
  RUN_TEST(test_capture_failure_rolls_back);
  RUN_TEST(test_transport_failure_stops_capture_and_allows_retry);
  RUN_TEST(test_second_start_is_rejected_while_busy);
  RUN_TEST(test_start_is_rejected_while_playback_is_held);
  RUN_TEST(test_capture_is_sent_only_when_open_and_unmuted);
  RUN_TEST(test_audio_delta_reaches_playback);
  RUN_TEST(test_malformed_message_keeps_session_open);
  RUN_TEST(test_toggle_speaker_follows_route_result);
  RUN_TEST(test_reversed_signal_within_window_does_not_flicker);
  RUN_TEST(test_pause_shorter_than_stop_window_keeps_speaking);
  RUN_TEST(test_confirmed_speech_interrupts_agent);
  RUN_TEST(test_unconfirmed_speech_does_not_interrupt);
  RUN_TEST(test_reconnect_backoff_until_failed);
  RUN_TEST(test_successful_reopen_resets_backoff_without_regreeting);
  RUN_TEST(test_end_call_while_reconnecting_cancels_retry);
  RUN_TEST(test_close_event_after_end_call_is_ignored);
  RUN_TEST(test_repeated_send_failures_force_reconnect);
  RUN_TEST(test_end_call_releases_everything_and_hands_over_transcript);
  RUN_TEST(test_end_call_when_idle_is_a_no_op);
  RUN_TEST(test_messages_after_end_call_are_dropped);
  UNITY_END();
}

void loop() {

}
#endif
