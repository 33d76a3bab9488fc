#include "voice_session.h"
#include "production_logger.h"

SessionTiming defaultSessionTiming() {
  SessionTiming timing;
  timing.speechStartDebounceMs = VB_SPEECH_START_DEBOUNCE_MS;
  timing.speechStopDebounceMs = VB_SPEECH_STOP_DEBOUNCE_MS;
  timing.reconnectBaseDelayMs = VB_RECONNECT_BASE_DELAY_MS;
  timing.maxReconnectAttempts = VB_MAX_RECONNECT_ATTEMPTS;
  timing.captureSampleRate = VB_NETWORK_SAMPLE_RATE;
  timing.captureIntervalMs = VB_CAPTURE_INTERVAL_MS;
  timing.realtime = defaultSessionOptions();
  return timing;
}

VoiceSession::VoiceSession(RealtimeTransport& transport, AudioCapture& capture, AudioOutput& output,
                           PlaybackScheduler& playback, CredentialProvider& credentials, TimerQueue& timers,
                           const String& realtimeUrl, const SessionTiming& timing)
  : transport(transport),
    capture(capture),
    output(output),
    playback(playback),
    credentials(credentials),
    timers(timers),
    realtimeUrl(realtimeUrl),
    timing(timing),
    listener(nullptr) {
  state.phase = PHASE_IDLE;
  resetState();
}

VoiceSession::~VoiceSession() {
  listener = nullptr;
  shutdown();
  transport.clearHandlers();
}

// ---------------------------------------------------------------------------
// Transition table

SessionPhase VoiceSession::nextPhase(SessionPhase current, SessionEvent event, int reconnectAttempt, int maxAttempts) {
  switch (event) {
    case SESSION_EV_CALL_STARTED:
      return (current == PHASE_IDLE || current == PHASE_FAILED) ? PHASE_CONNECTING : current;
    case SESSION_EV_START_ABORTED:
      return current == PHASE_CONNECTING ? PHASE_IDLE : current;
    case SESSION_EV_TRANSPORT_OPENED:
      return current == PHASE_CONNECTING ? PHASE_OPEN : current;
    case SESSION_EV_TRANSPORT_LOST:
      if (current != PHASE_CONNECTING && current != PHASE_OPEN) return current;
      return reconnectAttempt < maxAttempts ? PHASE_RECONNECTING : PHASE_FAILED;
    case SESSION_EV_RECONNECT_DUE:
      return current == PHASE_RECONNECTING ? PHASE_CONNECTING : current;
    case SESSION_EV_END_REQUESTED:
      return current == PHASE_IDLE ? PHASE_IDLE : PHASE_CLOSING;
    case SESSION_EV_TEARDOWN_COMPLETE:
      return current == PHASE_CLOSING ? PHASE_IDLE : current;
  }
  return current;
}

unsigned long VoiceSession::reconnectDelayMs(unsigned long baseDelayMs, int attempt) {
  if (attempt < 0) attempt = 0;
  if (attempt > 16) attempt = 16;
  return baseDelayMs << attempt;
}

const char* VoiceSession::phaseName(SessionPhase phase) {
  switch (phase) {
    case PHASE_IDLE: return "idle";
    case PHASE_CONNECTING: return "connecting";
    case PHASE_OPEN: return "open";
    case PHASE_RECONNECTING: return "reconnecting";
    case PHASE_CLOSING: return "closing";
    case PHASE_FAILED: return "failed";
  }
  return "unknown";
}

const char* VoiceSession::startResultName(StartCallResult result) {
  switch (result) {
    case START_OK: return "ok";
    case START_ERR_BUSY: return "busy";
    case START_ERR_OUTPUT: return "output";
    case START_ERR_CREDENTIAL: return "credential";
    case START_ERR_CAPTURE: return "capture";
    case START_ERR_TRANSPORT: return "transport";
  }
  return "unknown";
}

void VoiceSession::applyEvent(SessionEvent event) {
  SessionPhase next = nextPhase(state.phase, event, state.reconnectAttempt, timing.maxReconnectAttempts);
  if (next == state.phase) return;

  VB_LOG_DEBUG(LOG_SESSION, String("Phase ") + phaseName(state.phase) + " -> " + phaseName(next));
  state.phase = next;
  if (listener) listener->onPhaseChanged(next);
}

bool VoiceSession::isInCall() const {
  return state.phase == PHASE_CONNECTING || state.phase == PHASE_OPEN || state.phase == PHASE_RECONNECTING;
}

void VoiceSession::resetState() {
  state.reconnectAttempt = 0;
  state.workspaceId = "";
  state.agentId = "";
  state.token = "";
  state.agent = AgentProfile();
  state.agent.toolCount = 0;
  state.agent.temperature = 0.0f;
  state.agent.maxTokens = 0;
  state.muted = false;
  state.speakerOn = false;
  state.userSpeaking = false;
  state.aiSpeaking = false;
  state.ending = false;
  state.greetingSent = false;
  state.consecutiveSendFailures = 0;
  state.callStartedAt = 0;
  state.transcript.clear();
  state.speechStartTimer = VB_NO_TIMER;
  state.speechStopTimer = VB_NO_TIMER;
  state.reconnectTimer = VB_NO_TIMER;
}

// ---------------------------------------------------------------------------
// Call lifecycle

StartCallResult VoiceSession::startCall(const String& workspaceId, const String& agentId) {
  if (state.phase != PHASE_IDLE && state.phase != PHASE_FAILED) {
    VB_LOG_WARNING(LOG_SESSION, "Call already in progress", phaseName(state.phase));
    return START_ERR_BUSY;
  }
  if (playback.isActive()) {
    VB_LOG_WARNING(LOG_SESSION, "Playback is held by another call");
    return START_ERR_BUSY;
  }

  cancelTimers();
  resetState();
  state.workspaceId = workspaceId;
  state.agentId = agentId;
  state.callStartedAt = timers.now();
  applyEvent(SESSION_EV_CALL_STARTED);
  VB_LOG_INFO(LOG_SESSION, "Starting call", workspaceId + "/" + agentId);

  if (!output.setRoute(state.speakerOn)) {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to configure audio route");
    abortStart();
    return START_ERR_OUTPUT;
  }

  playback.reset();
  playback.setOnAiSpeakingChange([this](bool speaking) {
    handleAiSpeaking(speaking);
  });

  VoiceSessionGrant grant;
  if (!credentials.requestSession(workspaceId, agentId, grant)) {
    VB_LOG_ERROR(LOG_SESSION, "Could not obtain voice session credential");
    playback.destroy();
    abortStart();
    return START_ERR_CREDENTIAL;
  }
  state.token = grant.token;
  state.agent = grant.agent;

  RecordingConfig recording;
  recording.sampleRate = timing.captureSampleRate;
  recording.channels = 1;
  recording.intervalMs = timing.captureIntervalMs;
  if (!capture.startRecording(recording, [this](const String& chunk) { handleCapturedChunk(chunk); })) {
    VB_LOG_ERROR(LOG_AUDIO, "Microphone capture failed to start");
    playback.destroy();
    abortStart();
    return START_ERR_CAPTURE;
  }

  if (!openTransport()) {
    VB_LOG_ERROR(LOG_NETWORK, "Realtime transport failed to open", realtimeUrl);
    capture.stopRecording();
    playback.destroy();
    abortStart();
    return START_ERR_TRANSPORT;
  }
  return START_OK;
}

void VoiceSession::abortStart() {
  applyEvent(SESSION_EV_START_ABORTED);
  String workspaceId = state.workspaceId;
  resetState();
  VB_LOG_DEBUG(LOG_SESSION, "Call start rolled back", workspaceId);
}

void VoiceSession::endCall() {
  if (state.phase == PHASE_IDLE || state.phase == PHASE_CLOSING) {
    return;
  }

  VB_LOG_INFO(LOG_SESSION, "Ending call", "entries=" + String(state.transcript.size()));
  state.ending = true;
  applyEvent(SESSION_EV_END_REQUESTED);
  releaseResources();

  std::vector<TranscriptEntry> transcript;
  transcript.swap(state.transcript);
  applyEvent(SESSION_EV_TEARDOWN_COMPLETE);
  if (listener) listener->onCallEnded(transcript);
}

void VoiceSession::shutdown() {
  endCall();
}

void VoiceSession::releaseResources() {
  cancelTimers();
  playback.flush();
  capture.stopRecording();
  transport.close();
  playback.destroy();
  setUserSpeaking(false);
  state.aiSpeaking = false;
}

void VoiceSession::fail() {
  VB_LOG_ERROR(LOG_SESSION, "Reconnect attempts exhausted", "attempts=" + String(state.reconnectAttempt));
  state.ending = true;
  releaseResources();

  std::vector<TranscriptEntry> transcript;
  transcript.swap(state.transcript);
  if (listener) {
    listener->onCallFailed();
    listener->onCallEnded(transcript);
  }
}

void VoiceSession::cancelTimers() {
  timers.cancel(state.speechStartTimer);
  timers.cancel(state.speechStopTimer);
  timers.cancel(state.reconnectTimer);
}

// ---------------------------------------------------------------------------
// Transport

void VoiceSession::attachTransport() {
  transport.setHandlers(
    [this]() { handleTransportOpen(); },
    [this](const char* payload, size_t length) { handleTransportMessage(payload, length); },
    [this]() { handleTransportClosed(); },
    [](const String& reason) { VB_LOG_WARNING(LOG_NETWORK, "Realtime transport error", reason); });
}

bool VoiceSession::openTransport() {
  attachTransport();
  return transport.open(realtimeUrl, state.token);
}

void VoiceSession::handleTransportOpen() {
  if (state.ending || state.phase != PHASE_CONNECTING) return;

  applyEvent(SESSION_EV_TRANSPORT_OPENED);
  state.reconnectAttempt = 0;
  state.consecutiveSendFailures = 0;

  sendMessage(buildSessionUpdate(state.agent, timing.realtime));

  // Greeting only on the first connection of a call, not after reconnects
  if (!state.greetingSent && state.agent.initialGreeting.length() > 0) {
    state.greetingSent = true;
    sendMessage(buildGreetingItem(buildGreetingPrompt(state.agent.initialGreeting, false)));
    sendMessage(buildResponseCreate());
  }
}

void VoiceSession::handleTransportMessage(const char* payload, size_t length) {
  if (state.ending) return;

  RealtimeEvent event;
  if (!parseRealtimeEvent(payload, length, event)) {
    return;
  }

  switch (event.type) {
    case RT_SESSION_CREATED:
    case RT_SESSION_UPDATED:
      VB_LOG_INFO(LOG_SESSION, "Realtime session ready", event.rawType);
      break;

    case RT_AUDIO_DELTA:
      if (event.delta.length() > 0) {
        playback.enqueueBase64(event.delta);
      }
      break;

    case RT_TRANSCRIPT_DONE:
      appendTranscript(ROLE_ASSISTANT, event.transcript);
      break;

    case RT_INPUT_TRANSCRIPTION_COMPLETED:
      appendTranscript(ROLE_USER, event.transcript);
      break;

    case RT_SPEECH_STARTED:
      onSpeechStarted();
      break;

    case RT_SPEECH_STOPPED:
      onSpeechStopped();
      break;

    case RT_ERROR:
      VB_LOG_ERROR(LOG_SESSION, "Realtime endpoint error", event.errorCode + " " + event.errorMessage);
      break;

    case RT_TRANSCRIPT_DELTA:
    case RT_AUDIO_DONE:
    case RT_RESPONSE_DONE:
      break;

    case RT_EVENT_UNKNOWN:
      VB_LOG_DEBUG(LOG_SESSION, "Ignoring realtime event", event.rawType);
      break;
  }
}

void VoiceSession::handleTransportClosed() {
  if (state.ending) {
    VB_LOG_DEBUG(LOG_SESSION, "Transport closed after call end");
    return;
  }
  if (state.phase != PHASE_CONNECTING && state.phase != PHASE_OPEN) return;

  timers.cancel(state.speechStartTimer);
  timers.cancel(state.speechStopTimer);
  setUserSpeaking(false);
  scheduleReconnect();
}

void VoiceSession::scheduleReconnect() {
  applyEvent(SESSION_EV_TRANSPORT_LOST);
  if (state.phase == PHASE_FAILED) {
    fail();
    return;
  }

  unsigned long delayMs = reconnectDelayMs(timing.reconnectBaseDelayMs, state.reconnectAttempt);
  state.reconnectAttempt++;
  VB_LOG_WARNING(LOG_SESSION, "Connection lost, reconnecting",
                 "attempt=" + String(state.reconnectAttempt) + " delay=" + String(delayMs));

  timers.cancel(state.reconnectTimer);
  state.reconnectTimer = timers.schedule(delayMs, [this]() {
    state.reconnectTimer = VB_NO_TIMER;
    handleReconnectDue();
  });
}

void VoiceSession::handleReconnectDue() {
  if (state.ending || state.phase != PHASE_RECONNECTING) return;

  applyEvent(SESSION_EV_RECONNECT_DUE);
  if (!openTransport()) {
    VB_LOG_ERROR(LOG_NETWORK, "Reconnect could not open transport");
    handleTransportClosed();
  }
}

bool VoiceSession::sendMessage(const String& text) {
  if (!transport.isOpen()) return false;

  if (transport.send(text)) {
    state.consecutiveSendFailures = 0;
    return true;
  }

  state.consecutiveSendFailures++;
  if (state.consecutiveSendFailures >= VB_MAX_SEND_FAILURES) {
    VB_LOG_ERROR(LOG_NETWORK, "Repeated send failures, forcing reconnect",
                 "failures=" + String(state.consecutiveSendFailures));
    state.consecutiveSendFailures = 0;
    transport.close();
    handleTransportClosed();
  }
  return false;
}

// ---------------------------------------------------------------------------
// Audio

void VoiceSession::handleCapturedChunk(const String& base64Pcm16) {
  if (state.ending || state.muted || state.phase != PHASE_OPEN) return;
  sendMessage(buildAudioAppend(base64Pcm16));
}

void VoiceSession::handleAiSpeaking(bool speaking) {
  if (state.aiSpeaking == speaking) return;
  state.aiSpeaking = speaking;
  if (listener) listener->onAiSpeakingChanged(speaking);
}

bool VoiceSession::toggleMute() {
  state.muted = !state.muted;
  VB_LOG_INFO(LOG_SESSION, state.muted ? "Microphone muted" : "Microphone unmuted");
  return state.muted;
}

bool VoiceSession::toggleSpeaker() {
  bool speaker = !state.speakerOn;
  if (output.setRoute(speaker)) {
    state.speakerOn = speaker;
  } else {
    VB_LOG_ERROR(LOG_AUDIO, "Failed to switch audio route", speaker ? "speaker" : "earpiece");
  }
  return state.speakerOn;
}

// ---------------------------------------------------------------------------
// Voice activity

void VoiceSession::onSpeechStarted() {
  timers.cancel(state.speechStopTimer);
  if (state.userSpeaking || timers.isPending(state.speechStartTimer)) return;

  state.speechStartTimer = timers.schedule(timing.speechStartDebounceMs, [this]() {
    state.speechStartTimer = VB_NO_TIMER;
    if (state.ending) return;
    setUserSpeaking(true);
    if (state.aiSpeaking) {
      VB_LOG_INFO(LOG_SESSION, "Caller interrupted, stopping playback");
      playback.flush();
    }
  });
}

void VoiceSession::onSpeechStopped() {
  timers.cancel(state.speechStartTimer);
  if (!state.userSpeaking || timers.isPending(state.speechStopTimer)) return;

  state.speechStopTimer = timers.schedule(timing.speechStopDebounceMs, [this]() {
    state.speechStopTimer = VB_NO_TIMER;
    if (state.ending) return;
    setUserSpeaking(false);
  });
}

void VoiceSession::setUserSpeaking(bool speaking) {
  if (state.userSpeaking == speaking) return;
  state.userSpeaking = speaking;
  if (listener) listener->onUserSpeakingChanged(speaking);
}

void VoiceSession::appendTranscript(TranscriptRole role, const String& text) {
  if (text.length() == 0) return;

  TranscriptEntry entry;
  entry.role = role;
  entry.text = text;
  entry.timestamp = timers.now() - state.callStartedAt;
  state.transcript.push_back(entry);
  if (listener) listener->onTranscriptEntry(entry);
}
