#ifndef REALTIME_PROTOCOL_H
#define REALTIME_PROTOCOL_H

#include <Arduino.h>
#include "config.h"

// JSON messages exchanged with the speech-to-speech realtime endpoint

enum RealtimeEventType {
  RT_EVENT_UNKNOWN = 0,
  RT_SESSION_CREATED,
  RT_SESSION_UPDATED,
  RT_AUDIO_DELTA,
  RT_AUDIO_DONE,
  RT_TRANSCRIPT_DELTA,
  RT_TRANSCRIPT_DONE,
  RT_INPUT_TRANSCRIPTION_COMPLETED,
  RT_SPEECH_STARTED,
  RT_SPEECH_STOPPED,
  RT_RESPONSE_DONE,
  RT_ERROR
};

struct RealtimeEvent {
  RealtimeEventType type;
  String rawType;       // as received, kept for logging unknown events
  String delta;         // audio (base64 PCM16) or transcript fragment
  String transcript;
  String errorMessage;
  String errorCode;
};

// Agent persona returned by the credential endpoint
struct AgentProfile {
  String instructions;
  String voice;
  String initialGreeting;
  int toolCount;
  float temperature;  // 0 when the backend sends none
  int maxTokens;
};

struct RealtimeSessionOptions {
  String transcriptionModel;
  float vadThreshold;
  int prefixPaddingMs;
  int silenceDurationMs;
  float temperature;            // omitted when <= 0
  int maxResponseOutputTokens;  // omitted when <= 0
};

RealtimeSessionOptions defaultSessionOptions();
// Telephony leg: whisper transcription plus sampling limits
RealtimeSessionOptions telephonySessionOptions(const AgentProfile& agent);

// Returns false only when the payload is not valid JSON. A missing or
// unrecognised "type" yields RT_EVENT_UNKNOWN.
bool parseRealtimeEvent(const char* json, size_t length, RealtimeEvent& event);

String buildSessionUpdate(const AgentProfile& agent, const RealtimeSessionOptions& options);
String buildGreetingPrompt(const String& greeting, bool telephony);
String buildGreetingItem(const String& promptText);
String buildResponseCreate();
String buildAudioAppend(const String& base64Pcm16);

// Maps legacy voice ids onto the endpoint's native voices
String resolveVoiceName(const String& voice);

#endif
