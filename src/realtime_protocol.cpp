#include "realtime_protocol.h"
#include "production_logger.h"
#include <ArduinoJson.h>

namespace {

struct EventName {
  const char* name;
  RealtimeEventType type;
};

const EventName EVENT_NAMES[] = {
  {"session.created", RT_SESSION_CREATED},
  {"session.updated", RT_SESSION_UPDATED},
  {"response.audio.delta", RT_AUDIO_DELTA},
  {"response.audio.done", RT_AUDIO_DONE},
  {"response.audio_transcript.delta", RT_TRANSCRIPT_DELTA},
  {"response.audio_transcript.done", RT_TRANSCRIPT_DONE},
  {"conversation.item.input_audio_transcription.completed", RT_INPUT_TRANSCRIPTION_COMPLETED},
  {"input_audio_buffer.speech_started", RT_SPEECH_STARTED},
  {"input_audio_buffer.speech_stopped", RT_SPEECH_STOPPED},
  {"response.done", RT_RESPONSE_DONE},
  {"error", RT_ERROR},
};

const size_t EVENT_NAME_COUNT = sizeof(EVENT_NAMES) / sizeof(EVENT_NAMES[0]);

const char* NATIVE_VOICES[] = {"Sal", "Ara", "Eve", "Leo", "Rex"};

struct VoiceAlias {
  const char* alias;
  const char* voice;
};

const VoiceAlias VOICE_ALIASES[] = {
  {"alloy", "Sal"},
  {"shimmer", "Ara"},
  {"nova", "Eve"},
  {"echo", "Leo"},
  {"onyx", "Rex"},
};

RealtimeEventType lookupEventType(const char* name) {
  for (size_t i = 0; i < EVENT_NAME_COUNT; i++) {
    if (strcmp(EVENT_NAMES[i].name, name) == 0) return EVENT_NAMES[i].type;
  }
  return RT_EVENT_UNKNOWN;
}

} // namespace

RealtimeSessionOptions defaultSessionOptions() {
  RealtimeSessionOptions options;
  options.transcriptionModel = VB_TRANSCRIPTION_MODEL;
  options.vadThreshold = VB_VAD_THRESHOLD;
  options.prefixPaddingMs = VB_VAD_PREFIX_PADDING_MS;
  options.silenceDurationMs = VB_VAD_SILENCE_DURATION_MS;
  options.temperature = 0.0f;
  options.maxResponseOutputTokens = 0;
  return options;
}

RealtimeSessionOptions telephonySessionOptions(const AgentProfile& agent) {
  RealtimeSessionOptions options = defaultSessionOptions();
  options.transcriptionModel = VB_TELEPHONY_TRANSCRIPTION_MODEL;
  options.temperature = agent.temperature > 0.0f ? agent.temperature : VB_TELEPHONY_TEMPERATURE;
  options.maxResponseOutputTokens = agent.maxTokens > 0 ? agent.maxTokens : VB_TELEPHONY_MAX_OUTPUT_TOKENS;
  return options;
}

bool parseRealtimeEvent(const char* json, size_t length, RealtimeEvent& event) {
  event.type = RT_EVENT_UNKNOWN;
  event.rawType = "";
  event.delta = "";
  event.transcript = "";
  event.errorMessage = "";
  event.errorCode = "";

  if (json == nullptr || length == 0) return false;

  // Strings are copied into the pool, so it must hold the whole payload
  DynamicJsonDocument doc(length + 1024);
  DeserializationError error = deserializeJson(doc, json, length);
  if (error) {
    VB_LOG_WARNING(LOG_SESSION, "Malformed realtime message dropped", error.c_str());
    return false;
  }

  const char* type = doc["type"] | "";
  event.rawType = type;
  event.type = lookupEventType(type);

  switch (event.type) {
    case RT_AUDIO_DELTA:
    case RT_TRANSCRIPT_DELTA:
      event.delta = (const char*)(doc["delta"] | "");
      break;
    case RT_TRANSCRIPT_DONE:
    case RT_INPUT_TRANSCRIPTION_COMPLETED:
      event.transcript = (const char*)(doc["transcript"] | "");
      break;
    case RT_ERROR: {
      JsonVariant err = doc["error"];
      if (err.is<JsonObject>()) {
        event.errorMessage = (const char*)(err["message"] | "unknown error");
        event.errorCode = (const char*)(err["code"] | "");
      } else {
        event.errorMessage = (const char*)(doc["message"] | "unknown error");
      }
      break;
    }
    default:
      break;
  }
  return true;
}

String buildSessionUpdate(const AgentProfile& agent, const RealtimeSessionOptions& options) {
  DynamicJsonDocument doc(1024 + agent.instructions.length());
  doc["type"] = "session.update";

  JsonObject session = doc.createNestedObject("session");
  JsonArray modalities = session.createNestedArray("modalities");
  modalities.add("text");
  modalities.add("audio");
  session["instructions"] = agent.instructions.c_str();
  session["voice"] = resolveVoiceName(agent.voice);
  session["input_audio_format"] = "pcm16";
  session["output_audio_format"] = "pcm16";

  JsonObject transcription = session.createNestedObject("input_audio_transcription");
  transcription["model"] = options.transcriptionModel.c_str();

  JsonObject turnDetection = session.createNestedObject("turn_detection");
  turnDetection["type"] = "server_vad";
  turnDetection["threshold"] = options.vadThreshold;
  turnDetection["prefix_padding_ms"] = options.prefixPaddingMs;
  turnDetection["silence_duration_ms"] = options.silenceDurationMs;

  if (options.temperature > 0.0f) {
    session["temperature"] = options.temperature;
  }
  if (options.maxResponseOutputTokens > 0) {
    session["max_response_output_tokens"] = options.maxResponseOutputTokens;
  }

  String message;
  serializeJson(doc, message);
  return message;
}

String buildGreetingPrompt(const String& greeting, bool telephony) {
  if (telephony) {
    return "[SYSTEM] The call just connected. Greet the caller with: \"" + greeting + "\"";
  }
  return "You are starting a new call. Greet the caller with: \"" + greeting + "\"";
}

String buildGreetingItem(const String& promptText) {
  DynamicJsonDocument doc(512 + promptText.length());
  doc["type"] = "conversation.item.create";

  JsonObject item = doc.createNestedObject("item");
  item["type"] = "message";
  item["role"] = "user";
  JsonArray content = item.createNestedArray("content");
  JsonObject part = content.createNestedObject();
  part["type"] = "input_text";
  part["text"] = promptText.c_str();

  String message;
  serializeJson(doc, message);
  return message;
}

String buildResponseCreate() {
  return "{\"type\":\"response.create\"}";
}

String buildAudioAppend(const String& base64Pcm16) {
  // The payload is referenced, not copied, so a small pool is enough
  StaticJsonDocument<128> doc;
  doc["type"] = "input_audio_buffer.append";
  doc["audio"] = base64Pcm16.c_str();

  String message;
  message.reserve(base64Pcm16.length() + 64);
  serializeJson(doc, message);
  return message;
}

String resolveVoiceName(const String& voice) {
  for (size_t i = 0; i < sizeof(NATIVE_VOICES) / sizeof(NATIVE_VOICES[0]); i++) {
    if (voice == NATIVE_VOICES[i]) return voice;
  }

  String lower = voice;
  lower.toLowerCase();
  for (size_t i = 0; i < sizeof(VOICE_ALIASES) / sizeof(VOICE_ALIASES[0]); i++) {
    if (lower == VOICE_ALIASES[i].alias) return VOICE_ALIASES[i].voice;
  }
  return VB_DEFAULT_VOICE;
}
