#include "telephony_leg.h"
#include "encoding_service.h"
#include "production_logger.h"
#include <ArduinoJson.h>

bool parseTelephonyMessage(const char* json, size_t length, TelephonyMessage& message) {
  message.type = TEL_EVENT_UNKNOWN;
  message.event = "";
  message.streamId = "";
  message.payload = "";

  if (json == nullptr || length == 0) return false;

  DynamicJsonDocument doc(length + 512);
  DeserializationError error = deserializeJson(doc, json, length);
  if (error) {
    VB_LOG_WARNING(LOG_NETWORK, "Malformed telephony message dropped", error.c_str());
    return false;
  }

  const char* event = doc["event"] | "";
  message.event = event;

  if (strcmp(event, "start") == 0) {
    message.type = TEL_EVENT_START;
    // Some relays nest the stream id inside the start block
    const char* nested = doc["start"]["stream_id"] | "";
    message.streamId = (const char*)(doc["stream_id"] | nested);
  } else if (strcmp(event, "media") == 0) {
    message.type = TEL_EVENT_MEDIA;
    message.streamId = (const char*)(doc["stream_id"] | "");
    message.payload = (const char*)(doc["media"]["payload"] | "");
  } else if (strcmp(event, "stop") == 0) {
    message.type = TEL_EVENT_STOP;
    message.streamId = (const char*)(doc["stream_id"] | "");
  }
  return true;
}

String buildTelephonyMedia(const String& streamId, const uint8_t* mulaw, size_t length) {
  String payload = encodeBase64ToString(mulaw, length);

  StaticJsonDocument<192> doc;
  doc["event"] = "media";
  doc["stream_id"] = streamId.c_str();
  JsonObject media = doc.createNestedObject("media");
  media["payload"] = payload.c_str();

  String message;
  message.reserve(payload.length() + streamId.length() + 64);
  serializeJson(doc, message);
  return message;
}

TelephonyBridge::TelephonyBridge(RealtimeTransport& telephony, RealtimeTransport& ai,
                                 CredentialProvider& credentials, TimerQueue& timers)
  : telephony(telephony),
    ai(ai),
    credentials(credentials),
    timers(timers),
    greetingTimer(VB_NO_TIMER),
    startedAt(0),
    framesToCaller(0),
    framesFromCaller(0),
    useFilter(true),
    running(false),
    streamReady(false),
    aiReady(false),
    greetingSent(false) {
  agent.toolCount = 0;
  agent.temperature = 0.0f;
  agent.maxTokens = 0;
}

TelephonyBridge::~TelephonyBridge() {
  onStopped = nullptr;
  stop();
  telephony.clearHandlers();
  ai.clearHandlers();
}

bool TelephonyBridge::start(const String& telephonyUrl, const String& realtimeUrl,
                            const String& workspaceId, const String& agentId) {
  if (running) {
    VB_LOG_WARNING(LOG_SESSION, "Telephony bridge already running", streamId);
    return false;
  }

  VoiceSessionGrant grant;
  if (!credentials.requestSession(workspaceId, agentId, grant)) {
    VB_LOG_ERROR(LOG_SESSION, "Telephony bridge has no realtime credential");
    return false;
  }

  agent = grant.agent;
  filter.reset();
  framing.clear();
  transcript.clear();
  streamId = "";
  timers.cancel(greetingTimer);
  startedAt = timers.now();
  framesToCaller = 0;
  framesFromCaller = 0;
  streamReady = false;
  aiReady = false;
  greetingSent = false;
  running = true;

  attachHandlers();

  if (!ai.open(realtimeUrl, grant.token)) {
    VB_LOG_ERROR(LOG_NETWORK, "Realtime leg failed to open", realtimeUrl);
    running = false;
    return false;
  }
  if (!telephony.open(telephonyUrl, "")) {
    VB_LOG_ERROR(LOG_NETWORK, "Telephony leg failed to open", telephonyUrl);
    ai.close();
    running = false;
    return false;
  }

  VB_LOG_INFO(LOG_SESSION, "Telephony bridge started", workspaceId + "/" + agentId);
  return true;
}

void TelephonyBridge::stop() {
  if (!running) return;
  running = false;
  timers.cancel(greetingTimer);

  // Partial frame goes out as is
  if (!framing.empty() && telephony.isOpen()) {
    telephony.send(buildTelephonyMedia(streamId, framing.data(), framing.size()));
    framesToCaller++;
  }
  framing.clear();

  ai.close();
  telephony.close();

  TelephonyCallSummary summary;
  summary.streamId = streamId;
  summary.durationSeconds = (timers.now() - startedAt + 500) / 1000;
  summary.framesToCaller = framesToCaller;
  summary.framesFromCaller = framesFromCaller;
  summary.transcript.swap(transcript);

  VB_LOG_INFO(LOG_SESSION, "Telephony bridge stopped",
              String(summary.durationSeconds) + "s, " + String(summary.transcript.size()) + " transcript entries");

  if (onStopped) onStopped(summary);
}

void TelephonyBridge::attachHandlers() {
  telephony.setHandlers(
    []() { VB_LOG_DEBUG(LOG_NETWORK, "Telephony leg connected"); },
    [this](const char* payload, size_t length) { handleTelephonyMessage(payload, length); },
    [this]() {
      VB_LOG_INFO(LOG_NETWORK, "Telephony leg closed");
      stop();
    },
    [](const String& reason) { VB_LOG_WARNING(LOG_NETWORK, "Telephony leg error", reason); });

  ai.setHandlers(
    [this]() { handleAiOpen(); },
    [this](const char* payload, size_t length) { handleAiMessage(payload, length); },
    [this]() {
      if (!running) return;
      VB_LOG_WARNING(LOG_NETWORK, "Realtime leg closed, ending bridged call");
      stop();
    },
    [](const String& reason) { VB_LOG_WARNING(LOG_NETWORK, "Realtime leg error", reason); });
}

void TelephonyBridge::handleTelephonyMessage(const char* payload, size_t length) {
  if (!running) return;

  TelephonyMessage message;
  if (!parseTelephonyMessage(payload, length, message)) return;

  switch (message.type) {
    case TEL_EVENT_START:
      streamId = message.streamId;
      streamReady = true;
      VB_LOG_INFO(LOG_SESSION, "Telephony stream started", streamId);
      maybeSendGreeting();
      break;

    case TEL_EVENT_MEDIA:
      forwardCallerAudio(message.payload);
      break;

    case TEL_EVENT_STOP:
      VB_LOG_INFO(LOG_SESSION, "Telephony stream stopped", streamId);
      stop();
      break;

    case TEL_EVENT_UNKNOWN:
      VB_LOG_DEBUG(LOG_NETWORK, "Ignoring telephony event", message.event);
      break;
  }
}

void TelephonyBridge::handleAiOpen() {
  if (!running) return;
  ai.send(buildSessionUpdate(agent, telephonySessionOptions(agent)));
}

void TelephonyBridge::handleAiMessage(const char* payload, size_t length) {
  if (!running) return;

  RealtimeEvent event;
  if (!parseRealtimeEvent(payload, length, event)) return;

  switch (event.type) {
    case RT_SESSION_CREATED:
      aiReady = true;
      VB_LOG_INFO(LOG_SESSION, "Realtime session created for telephony leg");
      maybeSendGreeting();
      break;

    case RT_AUDIO_DELTA:
      forwardAgentAudio(event.delta);
      break;

    case RT_TRANSCRIPT_DONE:
      appendTranscript(ROLE_ASSISTANT, event.transcript);
      break;

    case RT_INPUT_TRANSCRIPTION_COMPLETED:
      appendTranscript(ROLE_USER, event.transcript);
      break;

    case RT_ERROR:
      VB_LOG_ERROR(LOG_SESSION, "Realtime endpoint error", event.errorCode + " " + event.errorMessage);
      break;

    default:
      break;
  }
}

void TelephonyBridge::forwardCallerAudio(const String& base64Mulaw) {
  if (base64Mulaw.length() == 0 || !ai.isOpen()) return;

  std::vector<uint8_t> mulaw = decodeBase64ToVector(base64Mulaw);
  if (mulaw.empty()) return;
  framesFromCaller++;

  std::vector<uint8_t> pcm = pcm16ToBytes(downlinkToNetwork(mulaw));
  ai.send(buildAudioAppend(encodeBase64ToString(pcm)));
}

void TelephonyBridge::forwardAgentAudio(const String& base64Pcm16) {
  if (base64Pcm16.length() == 0 || !telephony.isOpen()) return;

  std::vector<uint8_t> bytes = decodeBase64ToVector(base64Pcm16);
  if (bytes.empty()) return;

  std::vector<uint8_t> mulaw = uplinkFromNetwork(pcm16FromBytes(bytes), useFilter ? &filter : nullptr);
  framing.insert(framing.end(), mulaw.begin(), mulaw.end());
  sendFrames();
}

void TelephonyBridge::sendFrames() {
  size_t offset = 0;
  while (framing.size() - offset >= VB_TELEPHONY_MIN_CHUNK_BYTES) {
    telephony.send(buildTelephonyMedia(streamId, framing.data() + offset, VB_TELEPHONY_MIN_CHUNK_BYTES));
    framesToCaller++;
    offset += VB_TELEPHONY_MIN_CHUNK_BYTES;
  }
  if (offset > 0) {
    framing.erase(framing.begin(), framing.begin() + offset);
  }
}

void TelephonyBridge::maybeSendGreeting() {
  if (!streamReady || !aiReady || !ai.isOpen()) return;
  if (agent.initialGreeting.length() == 0 || greetingSent) return;
  greetingSent = true;

  VB_LOG_DEBUG(LOG_SESSION, "Both legs ready, greeting scheduled");
  greetingTimer = timers.schedule(VB_GREETING_DELAY_MS, [this]() {
    greetingTimer = VB_NO_TIMER;
    if (!running || !ai.isOpen()) return;
    ai.send(buildGreetingItem(buildGreetingPrompt(agent.initialGreeting, true)));
    ai.send(buildResponseCreate());
  });
}

void TelephonyBridge::appendTranscript(TranscriptRole role, const String& text) {
  if (text.length() == 0) return;

  TranscriptEntry entry;
  entry.role = role;
  entry.text = text;
  entry.timestamp = timers.now() - startedAt;
  transcript.push_back(entry);
}
