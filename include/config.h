#ifndef CONFIG_H
#define CONFIG_H

#include <Arduino.h>

// Firmware identification
#define FIRMWARE_NAME "receptionist-voice-bridge"
#define FIRMWARE_VERSION "1.0.0"
#define CONFIG_SCHEMA_VERSION 1

// Environment detection
#ifdef PRODUCTION_BUILD
  #define ENVIRONMENT_MODE "production"
  #define VB_PRODUCTION_MODE 1
  #define DEFAULT_LOG_LEVEL 2  // ERROR and CRITICAL only
  #define DEFAULT_API_BASE_URL "https://api.receptionist.app"
  #define DEFAULT_REALTIME_URL "wss://api.x.ai/v1/realtime"
#elif defined(STAGING_BUILD)
  #define ENVIRONMENT_MODE "staging"
  #define VB_PRODUCTION_MODE 0
  #define DEFAULT_LOG_LEVEL 4  // INFO and above
  #define DEFAULT_API_BASE_URL "https://staging-api.receptionist.app"
  #define DEFAULT_REALTIME_URL "wss://api.x.ai/v1/realtime"
#else
  #define ENVIRONMENT_MODE "development"
  #define VB_PRODUCTION_MODE 0
  #define DEFAULT_LOG_LEVEL 5  // everything
  #define DEFAULT_API_BASE_URL "http://192.168.1.10:3000"
  #define DEFAULT_REALTIME_URL "wss://api.x.ai/v1/realtime"
#endif

#ifndef PRODUCTION_MODE
#define PRODUCTION_MODE VB_PRODUCTION_MODE
#endif

// Relay that carries 8kHz u-law telephony media (telephony bridge mode only)
#define DEFAULT_TELEPHONY_RELAY_URL ""

// Bridge modes
#define VB_MODE_HANDSET   0
#define VB_MODE_TELEPHONY 1
#define DEFAULT_BRIDGE_MODE VB_MODE_HANDSET

// Audio formats
#define VB_NETWORK_SAMPLE_RATE   24000  // PCM16 mono to and from the realtime endpoint
#define VB_TELEPHONY_SAMPLE_RATE 8000   // u-law telephony leg
#define VB_RESAMPLE_FACTOR       3
#define VB_CAPTURE_INTERVAL_MS   100
#define VB_TELEPHONY_MIN_CHUNK_BYTES 160  // 20ms at 8kHz u-law

// Playback scheduler
#define VB_PLAYBACK_FLUSH_THRESHOLD 9600  // 200ms of PCM16 mono at 24kHz
#define VB_PLAYBACK_FLUSH_TIMEOUT_MS 150

// Voice activity debounce
#define VB_SPEECH_START_DEBOUNCE_MS 100
#define VB_SPEECH_STOP_DEBOUNCE_MS  500

// Reconnection
#define VB_RECONNECT_BASE_DELAY_MS 1000
#define VB_MAX_RECONNECT_ATTEMPTS  5
#define VB_MAX_SEND_FAILURES       3

// Telephony greeting is sent this long after both legs are ready
#define VB_GREETING_DELAY_MS 300

// Realtime session defaults
#define VB_DEFAULT_VOICE "Ara"
#define VB_TRANSCRIPTION_MODEL "grok-2-public"
#define VB_VAD_THRESHOLD 0.5
#define VB_VAD_PREFIX_PADDING_MS 300
#define VB_VAD_SILENCE_DURATION_MS 500
#define VB_HTTP_TIMEOUT_MS 10000
#define VB_WS_CONNECT_TIMEOUT_MS 10000

// Telephony leg session defaults, used when the agent carries none
#define VB_TELEPHONY_TRANSCRIPTION_MODEL "whisper-1"
#define VB_TELEPHONY_TEMPERATURE 0.7f
#define VB_TELEPHONY_MAX_OUTPUT_TOKENS 1024

// Hardware pins
#define CALL_BUTTON_PIN 0
#define MUTE_BUTTON_PIN 4
#define STATUS_LED_PIN 2
#define SPEAKER_GAIN_PIN 21   // amplifier gain select: HIGH = loudspeaker, LOW = earpiece level
#ifndef DEBOUNCE_DELAY
#define DEBOUNCE_DELAY 200
#endif

// Microphone (I2S port 1, INMP441 style)
#define I2S_MIC_SCK 14
#define I2S_MIC_WS 15
#define I2S_MIC_SD 32

// Amplifier (I2S port 0, MAX98357 style)
#define I2S_SPK_BCLK 26
#define I2S_SPK_LRC 25
#define I2S_SPK_DIN 22

#define I2S_DMA_BUFFER_COUNT 8
#define I2S_DMA_BUFFER_LEN 480

#endif
