#ifndef TELEPHONY_LEG_H
#define TELEPHONY_LEG_H

#include <Arduino.h>
#include <functional>
#include <vector>
#include "audio_codec.h"
#include "config.h"
#include "realtime_protocol.h"
#include "realtime_transport.h"
#include "timer_queue.h"
#include "voice_session.h"
#include "voice_session_client.h"

// Media socket events of the 8kHz u-law telephony leg
enum TelephonyEventType {
  TEL_EVENT_UNKNOWN = 0,
  TEL_EVENT_START,
  TEL_EVENT_MEDIA,
  TEL_EVENT_STOP
};

struct TelephonyMessage {
  TelephonyEventType type;
  String event;
  String streamId;
  String payload;   // base64 u-law, media only
};

bool parseTelephonyMessage(const char* json, size_t length, TelephonyMessage& message);
String buildTelephonyMedia(const String& streamId, const uint8_t* mulaw, size_t length);

struct TelephonyCallSummary {
  String streamId;
  unsigned long durationSeconds;
  uint32_t framesToCaller;
  uint32_t framesFromCaller;
  std::vector<TranscriptEntry> transcript;
};

// Bridges one telephony media stream to the realtime endpoint.
//
// Caller audio: u-law 8kHz -> PCM16 24kHz -> input_audio_buffer.append.
// Agent audio: PCM16 24kHz -> u-law 8kHz, re-framed into exact
// VB_TELEPHONY_MIN_CHUNK_BYTES media frames. The greeting goes out once,
// VB_GREETING_DELAY_MS after both legs are ready.
class TelephonyBridge {
public:
  typedef std::function<void(const TelephonyCallSummary& summary)> StoppedCallback;

  TelephonyBridge(RealtimeTransport& telephony, RealtimeTransport& ai,
                  CredentialProvider& credentials, TimerQueue& timers);
  ~TelephonyBridge();

  bool start(const String& telephonyUrl, const String& realtimeUrl,
             const String& workspaceId, const String& agentId);
  // Flushes the partial frame, closes both legs and reports the summary
  void stop();

  void setAntiAliasFilter(bool enabled) { useFilter = enabled; }
  void setOnStopped(StoppedCallback callback) { onStopped = callback; }

  bool isRunning() const { return running; }
  bool isStreamReady() const { return streamReady; }
  bool isAiReady() const { return aiReady; }
  bool isGreetingSent() const { return greetingSent; }
  const String& getStreamId() const { return streamId; }
  size_t getFramingBacklog() const { return framing.size(); }
  const std::vector<TranscriptEntry>& getTranscript() const { return transcript; }

private:
  RealtimeTransport& telephony;
  RealtimeTransport& ai;
  CredentialProvider& credentials;
  TimerQueue& timers;

  AgentProfile agent;
  DecimationFilter filter;
  std::vector<uint8_t> framing;
  std::vector<TranscriptEntry> transcript;
  String streamId;
  TimerToken greetingTimer;
  unsigned long startedAt;
  uint32_t framesToCaller;
  uint32_t framesFromCaller;
  bool useFilter;
  bool running;
  bool streamReady;
  bool aiReady;
  bool greetingSent;
  StoppedCallback onStopped;

  void attachHandlers();
  void handleTelephonyMessage(const char* payload, size_t length);
  void handleAiOpen();
  void handleAiMessage(const char* payload, size_t length);
  void forwardCallerAudio(const String& base64Mulaw);
  void forwardAgentAudio(const String& base64Pcm16);
  void sendFrames();
  void maybeSendGreeting();
  void appendTranscript(TranscriptRole role, const String& text);
};

#endif
