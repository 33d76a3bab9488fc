#ifndef VOICE_SESSION_H
#define VOICE_SESSION_H

#include <Arduino.h>
#include <vector>
#include "audio_io.h"
#include "config.h"
#include "playback_scheduler.h"
#include "realtime_protocol.h"
#include "realtime_transport.h"
#include "timer_queue.h"
#include "voice_session_client.h"

enum SessionPhase {
  PHASE_IDLE,
  PHASE_CONNECTING,
  PHASE_OPEN,
  PHASE_RECONNECTING,
  PHASE_CLOSING,
  PHASE_FAILED        // reconnect attempts exhausted
};

enum SessionEvent {
  SESSION_EV_CALL_STARTED,
  SESSION_EV_START_ABORTED,
  SESSION_EV_TRANSPORT_OPENED,
  SESSION_EV_TRANSPORT_LOST,
  SESSION_EV_RECONNECT_DUE,
  SESSION_EV_END_REQUESTED,
  SESSION_EV_TEARDOWN_COMPLETE
};

enum StartCallResult {
  START_OK,
  START_ERR_BUSY,        // another call holds the session or the playback scheduler
  START_ERR_OUTPUT,
  START_ERR_CREDENTIAL,
  START_ERR_CAPTURE,
  START_ERR_TRANSPORT
};

enum TranscriptRole {
  ROLE_USER,
  ROLE_ASSISTANT
};

struct TranscriptEntry {
  TranscriptRole role;
  String text;
  unsigned long timestamp;
};

struct SessionState {
  SessionPhase phase;
  int reconnectAttempt;
  String workspaceId;
  String agentId;
  String token;               // reused across reconnects, never refreshed mid-call
  AgentProfile agent;
  bool muted;
  bool speakerOn;
  bool userSpeaking;
  bool aiSpeaking;
  bool ending;
  bool greetingSent;
  int consecutiveSendFailures;
  unsigned long callStartedAt;
  std::vector<TranscriptEntry> transcript;
  TimerToken speechStartTimer;
  TimerToken speechStopTimer;
  TimerToken reconnectTimer;
};

struct SessionTiming {
  unsigned long speechStartDebounceMs;
  unsigned long speechStopDebounceMs;
  unsigned long reconnectBaseDelayMs;
  int maxReconnectAttempts;
  uint32_t captureSampleRate;
  uint16_t captureIntervalMs;
  RealtimeSessionOptions realtime;
};

SessionTiming defaultSessionTiming();

class SessionListener {
public:
  virtual ~SessionListener() {}
  virtual void onPhaseChanged(SessionPhase phase) {}
  virtual void onUserSpeakingChanged(bool speaking) {}
  virtual void onAiSpeakingChanged(bool speaking) {}
  virtual void onTranscriptEntry(const TranscriptEntry& entry) {}
  virtual void onCallFailed() {}
  virtual void onCallEnded(const std::vector<TranscriptEntry>& transcript) {}
};

// One handset call against the realtime endpoint: capture -> transport,
// transport -> playback, with VAD debouncing, barge-in and reconnection.
// Every entry point runs on the loop task.
class VoiceSession {
public:
  VoiceSession(RealtimeTransport& transport, AudioCapture& capture, AudioOutput& output,
               PlaybackScheduler& playback, CredentialProvider& credentials, TimerQueue& timers,
               const String& realtimeUrl, const SessionTiming& timing = defaultSessionTiming());
  ~VoiceSession();

  StartCallResult startCall(const String& workspaceId, const String& agentId);
  void endCall();
  // Same teardown as endCall, for owner shutdown / deep sleep
  void shutdown();

  bool toggleMute();
  bool toggleSpeaker();

  void setListener(SessionListener* listener) { this->listener = listener; }

  const SessionState& getState() const { return state; }
  SessionPhase getPhase() const { return state.phase; }
  bool isInCall() const;

  // Pure transition table
  static SessionPhase nextPhase(SessionPhase current, SessionEvent event, int reconnectAttempt, int maxAttempts);
  static unsigned long reconnectDelayMs(unsigned long baseDelayMs, int attempt);
  static const char* phaseName(SessionPhase phase);
  static const char* startResultName(StartCallResult result);

private:
  RealtimeTransport& transport;
  AudioCapture& capture;
  AudioOutput& output;
  PlaybackScheduler& playback;
  CredentialProvider& credentials;
  TimerQueue& timers;
  String realtimeUrl;
  SessionTiming timing;
  SessionListener* listener;
  SessionState state;

  void resetState();
  void applyEvent(SessionEvent event);
  void attachTransport();
  bool openTransport();
  void abortStart();

  void handleTransportOpen();
  void handleTransportMessage(const char* payload, size_t length);
  void handleTransportClosed();
  void handleReconnectDue();
  void handleCapturedChunk(const String& base64Pcm16);
  void handleAiSpeaking(bool speaking);

  void onSpeechStarted();
  void onSpeechStopped();
  void setUserSpeaking(bool speaking);
  void appendTranscript(TranscriptRole role, const String& text);

  bool sendMessage(const String& text);
  void scheduleReconnect();
  void cancelTimers();
  void releaseResources();
  void fail();
};

#endif
