/*
RECEPTIONIST VOICE BRIDGE - ESP32 FIRMWARE
=========================================
Handset mode: I2S microphone and amplifier talk to the realtime voice agent.
Telephony mode: a relay's 8kHz u-law media stream is bridged to the agent.
*/
#ifndef UNIT_TEST

#include <Arduino.h>
#include <WiFi.h>
#include <memory>
#include "config.h"
#include "config_manager.h"
#include "hardware.h"
#include "i2s_audio.h"
#include "playback_scheduler.h"
#include "production_logger.h"
#include "setup_console.h"
#include "telephony_leg.h"
#include "timer_queue.h"
#include "voice_session.h"
#include "voice_session_client.h"
#include "websocket_transport.h"
#include "wifi_manager.h"
#include "esp_task_wdt.h"

#define SYSTEM_CHECK_INTERVAL 60000

static TimerQueue timers;
static I2SAudioOutput audioOutput;
static I2SMicCapture micCapture;
static WebSocketTransport realtimeTransport("realtime");
static WebSocketTransport telephonyTransport("telephony");

static std::unique_ptr<VoiceSessionClient> credentialClient;
static std::unique_ptr<PlaybackScheduler> playback;
static std::unique_ptr<VoiceSession> session;
static std::unique_ptr<TelephonyBridge> telephonyBridge;

static bool audioReady = false;
static unsigned long lastSystemCheck = 0;

void initBridgeSystems();
void handleButtons();
void printSystemInfo();

static const char* roleName(TranscriptRole role) {
  return role == ROLE_USER ? "caller" : "agent";
}

class DeviceSessionListener : public SessionListener {
public:
  void onPhaseChanged(SessionPhase phase) override {
    switch (phase) {
      case PHASE_OPEN: setStatusLed(LED_ON); break;
      case PHASE_CONNECTING:
      case PHASE_RECONNECTING: setStatusLed(LED_BLINK_SLOW); break;
      case PHASE_FAILED: setStatusLed(LED_BLINK_FAST); break;
      default: setStatusLed(LED_OFF); break;
    }
  }

  void onTranscriptEntry(const TranscriptEntry& entry) override {
    VB_LOG_INFO(LOG_SESSION, String(roleName(entry.role)) + ": " + entry.text);
  }

  void onCallFailed() override {
    VB_LOG_ERROR(LOG_SESSION, "Call dropped after reconnect attempts were exhausted");
  }

  void onCallEnded(const std::vector<TranscriptEntry>& transcript) override {
    Serial.printf("Call ended, %u transcript entries\n", (unsigned)transcript.size());
    for (size_t i = 0; i < transcript.size(); i++) {
      Serial.printf("[%6lu ms] %s: %s\n", transcript[i].timestamp, roleName(transcript[i].role),
                    transcript[i].text.c_str());
    }
  }
};

static DeviceSessionListener sessionListener;

void setup() {
  Serial.begin(115200);
  delay(50);

  esp_task_wdt_init(20, true);
  esp_task_wdt_add(NULL);

  initBridgeSystems();
  esp_task_wdt_reset();
  printSystemInfo();
}

void loop() {
  esp_task_wdt_reset();

  handleWiFiManager();
  realtimeTransport.loop();
  telephonyTransport.loop();

  if (audioReady) {
    micCapture.service();
    audioOutput.service();
  }
  timers.poll(millis());

  handleButtons();
  handleSetupConsole();
  updateStatusLed();

  if (millis() - lastSystemCheck > SYSTEM_CHECK_INTERVAL) {
    lastSystemCheck = millis();
    ProductionLogger::logSystemStatus("heap", ESP.getFreeHeap() > 40000, String(ESP.getFreeHeap()) + " bytes free");
    ProductionLogger::logSystemStatus("wifi", isWiFiConnected(), getWiFiReconnectStats());
    VB_LOG_DEBUG(LOG_NETWORK, "Realtime socket traffic",
                 "sent=" + String(realtimeTransport.getMessagesSent()) +
                 " received=" + String(realtimeTransport.getMessagesReceived()));
    if (micCapture.getDroppedBytes() > 0) {
      VB_LOG_WARNING(LOG_AUDIO, "Microphone ring overflowed", String(micCapture.getDroppedBytes()) + " bytes dropped");
    }
  }

  delay(1);
}

void initBridgeSystems() {
  ProductionLogger::init();
  VB_LOG_INFO(LOG_SYSTEM, "Starting " FIRMWARE_NAME, FIRMWARE_VERSION);

  if (!configManager.init()) {
    VB_LOG_CRITICAL(LOG_CONFIG, "Configuration storage unavailable, running on defaults");
  }
  const BridgeConfig& config = configManager.getConfig();

  initHardware();
  initWiFiManager();
  connectToWiFi();

  credentialClient.reset(new VoiceSessionClient(config.api_base_url, config.api_token, config.ca_cert));
  realtimeTransport.setCACert(config.ca_cert);

  if (config.bridge_mode == VB_MODE_TELEPHONY) {
    telephonyBridge.reset(new TelephonyBridge(telephonyTransport, realtimeTransport, *credentialClient, timers));
    telephonyBridge->setAntiAliasFilter(config.use_aa_filter);
    telephonyBridge->setOnStopped([](const TelephonyCallSummary& summary) {
      Serial.printf("Bridged call %s: %lus, %u frames out, %u frames in, %u transcript entries\n",
                    summary.streamId.c_str(), summary.durationSeconds, summary.framesToCaller,
                    summary.framesFromCaller, (unsigned)summary.transcript.size());
      setStatusLed(LED_OFF);
    });
    VB_LOG_INFO(LOG_SYSTEM, "Telephony bridge mode", config.telephony_relay_url);
    return;
  }

  audioReady = audioOutput.begin();
  if (!audioReady) {
    VB_LOG_CRITICAL(LOG_AUDIO, "Speaker output unavailable, calls disabled");
    setStatusLed(LED_BLINK_FAST);
    return;
  }

  playback.reset(new PlaybackScheduler(audioOutput, timers, config.flush_threshold_bytes,
                                       config.flush_timeout_ms, VB_NETWORK_SAMPLE_RATE));

  SessionTiming timing = defaultSessionTiming();
  timing.speechStartDebounceMs = config.speech_start_debounce_ms;
  timing.speechStopDebounceMs = config.speech_stop_debounce_ms;
  timing.reconnectBaseDelayMs = config.reconnect_base_delay_ms;
  timing.maxReconnectAttempts = config.max_reconnect_attempts;
  timing.captureIntervalMs = config.capture_interval_ms;

  session.reset(new VoiceSession(realtimeTransport, micCapture, audioOutput, *playback,
                                 *credentialClient, timers, config.realtime_url, timing));
  session->setListener(&sessionListener);
}

void handleButtons() {
  ButtonEvent event = pollButtons();
  if (event == BUTTON_NONE) return;

  const BridgeConfig& config = configManager.getConfig();
  if (!config.configured) {
    VB_LOG_WARNING(LOG_CONFIG, "Device not provisioned, use the serial console");
    setStatusLed(LED_BLINK_FAST);
    return;
  }

  if (telephonyBridge) {
    if (event != BUTTON_CALL) return;
    if (telephonyBridge->isRunning()) {
      telephonyBridge->stop();
    } else if (isWiFiConnected() &&
               telephonyBridge->start(config.telephony_relay_url, config.realtime_url,
                                      config.workspace_id, config.agent_id)) {
      setStatusLed(LED_ON);
    } else {
      setStatusLed(LED_BLINK_FAST);
    }
    return;
  }

  if (!session) return;

  switch (event) {
    case BUTTON_CALL:
      if (session->getPhase() == PHASE_IDLE || session->getPhase() == PHASE_FAILED) {
        if (!isWiFiConnected()) {
          VB_LOG_WARNING(LOG_NETWORK, "Cannot start call without WiFi");
          setStatusLed(LED_BLINK_FAST);
          break;
        }
        StartCallResult result = session->startCall(config.workspace_id, config.agent_id);
        if (result != START_OK) {
          VB_LOG_ERROR(LOG_SESSION, "Call did not start", VoiceSession::startResultName(result));
          setStatusLed(LED_BLINK_FAST);
        }
      } else {
        session->endCall();
      }
      break;

    case BUTTON_MUTE:
      session->toggleMute();
      break;

    case BUTTON_SPEAKER:
      session->toggleSpeaker();
      break;

    default:
      break;
  }
}

void printSystemInfo() {
  const BridgeConfig& config = configManager.getConfig();
  VB_LOG_INFO(LOG_SYSTEM, "Firmware", String(FIRMWARE_NAME) + " " + FIRMWARE_VERSION + " (" + ENVIRONMENT_MODE + ")");
  VB_LOG_INFO(LOG_SYSTEM, "Chip", String(ESP.getChipModel()) + " rev " + String(ESP.getChipRevision()));
  VB_LOG_INFO(LOG_SYSTEM, "MAC", WiFi.macAddress());
  VB_LOG_INFO(LOG_SYSTEM, "Free heap", String(ESP.getFreeHeap()));
  VB_LOG_INFO(LOG_SYSTEM, "Provisioned", config.configured ? "yes" : "no");
}

#endif // UNIT_TEST
