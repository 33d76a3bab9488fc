#include "wifi_manager.h"
#include "config_manager.h"
#include "hardware.h"
#include "production_logger.h"
#include <esp_task_wdt.h>

void attemptWiFiReconnectionStep();

static bool wifiInitialized = false;

struct WiFiReconnectState {
  unsigned long lastDisconnectTime = 0;
  unsigned long reconnectDelay = WIFI_RECONNECT_INITIAL_MS;
  unsigned int reconnectAttempts = 0;
  unsigned long totalDisconnections = 0;
  bool isReconnecting = false;
  unsigned long lastConnectionCheck = 0;
  bool wasConnected = false;
};

static WiFiReconnectState reconnectState;

// Progress of the association started by the current attempt
static struct {
  bool inProgress = false;
  unsigned long startCheckMs = 0;
} quickCheck;

bool initWiFiManager() {
  if (wifiInitialized) return true;

  WiFi.persistent(false);
  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(false);  // reconnection is driven from handleWiFiManager()
  WiFi.setSleep(false);          // modem sleep adds latency to realtime audio

  wifiInitialized = true;
  return true;
}

bool connectToWiFi() {
  if (!wifiInitialized) initWiFiManager();

  const BridgeConfig& config = configManager.getConfig();
  if (config.wifi_ssid.length() == 0) {
    VB_LOG_ERROR(LOG_NETWORK, "No stored WiFi credentials");
    return false;
  }

  VB_LOG_INFO(LOG_NETWORK, "Connecting to WiFi", config.wifi_ssid);
  WiFi.begin(config.wifi_ssid.c_str(), config.wifi_password.c_str());

  unsigned long start = millis();
  while (millis() - start < WIFI_CONNECT_WINDOW_MS && WiFi.status() != WL_CONNECTED) {
    delay(50);
    esp_task_wdt_reset();
    yield();
  }

  reconnectState.wasConnected = WiFi.status() == WL_CONNECTED;
  if (!reconnectState.wasConnected) {
    VB_LOG_WARNING(LOG_NETWORK, "WiFi not connected yet, retrying in background");
    reconnectState.isReconnecting = true;
    reconnectState.lastDisconnectTime = millis();
    setStatusLed(LED_BLINK_FAST);
    return false;
  }

  VB_LOG_INFO(LOG_NETWORK, "WiFi connected", WiFi.localIP().toString());
  reconnectState.reconnectAttempts = 0;
  reconnectState.reconnectDelay = WIFI_RECONNECT_INITIAL_MS;
  reconnectState.isReconnecting = false;
  setStatusLed(LED_OFF);
  return true;
}

void handleWiFiManager() {
  unsigned long now = millis();
  bool currentlyConnected = (WiFi.status() == WL_CONNECTED);

  if (now - reconnectState.lastConnectionCheck > WIFI_CHECK_INTERVAL_MS) {
    reconnectState.lastConnectionCheck = now;

    if (!currentlyConnected && reconnectState.wasConnected) {
      reconnectState.lastDisconnectTime = now;
      reconnectState.totalDisconnections++;
      reconnectState.reconnectDelay = WIFI_RECONNECT_INITIAL_MS;
      reconnectState.reconnectAttempts = 0;
      reconnectState.isReconnecting = true;
      quickCheck.inProgress = false;

      VB_LOG_WARNING(LOG_NETWORK, "WiFi disconnected", "total=" + String(reconnectState.totalDisconnections));
      setStatusLed(LED_BLINK_FAST);
    }

    if (currentlyConnected && !reconnectState.wasConnected) {
      VB_LOG_INFO(LOG_NETWORK, "WiFi reconnected", "attempts=" + String(reconnectState.reconnectAttempts));
      reconnectState.isReconnecting = false;
      reconnectState.reconnectAttempts = 0;
      reconnectState.reconnectDelay = WIFI_RECONNECT_INITIAL_MS;
      quickCheck.inProgress = false;
      setStatusLed(LED_OFF);
    }

    reconnectState.wasConnected = currentlyConnected;
  }

  if (!currentlyConnected && reconnectState.isReconnecting) {
    if (quickCheck.inProgress || now - reconnectState.lastDisconnectTime >= reconnectState.reconnectDelay) {
      attemptWiFiReconnectionStep();
    }
  }
}

void attemptWiFiReconnectionStep() {
  if (!quickCheck.inProgress) {
    const BridgeConfig& config = configManager.getConfig();
    if (config.wifi_ssid.length() == 0) {
      VB_LOG_ERROR(LOG_NETWORK, "No WiFi credentials for reconnect");
      reconnectState.isReconnecting = false;
      return;
    }

    reconnectState.reconnectAttempts++;
    VB_LOG_INFO(LOG_NETWORK, "WiFi reconnect attempt",
                String(reconnectState.reconnectAttempts) + " (delay " + String(reconnectState.reconnectDelay) + "ms)");

    WiFi.disconnect();
    WiFi.begin(config.wifi_ssid.c_str(), config.wifi_password.c_str());
    quickCheck.inProgress = true;
    quickCheck.startCheckMs = millis();
    return;
  }

  if (WiFi.status() == WL_CONNECTED) {
    reconnectState.isReconnecting = false;
    reconnectState.reconnectAttempts = 0;
    reconnectState.reconnectDelay = WIFI_RECONNECT_INITIAL_MS;
    quickCheck.inProgress = false;
    return;
  }

  if (millis() - quickCheck.startCheckMs >= WIFI_ATTEMPT_TIMEOUT_MS) {
    // 0.5s -> 1s -> 2s -> 4s -> 8s
    reconnectState.reconnectDelay = reconnectState.reconnectDelay < WIFI_RECONNECT_MAX_MS
      ? reconnectState.reconnectDelay * 2 : WIFI_RECONNECT_MAX_MS;
    if (reconnectState.reconnectDelay > WIFI_RECONNECT_MAX_MS) {
      reconnectState.reconnectDelay = WIFI_RECONNECT_MAX_MS;
    }
    reconnectState.lastDisconnectTime = millis();
    quickCheck.inProgress = false;
    VB_LOG_DEBUG(LOG_NETWORK, "WiFi reconnect failed", "next in " + String(reconnectState.reconnectDelay) + "ms");
  }
}

bool isWiFiConnected() {
  return WiFi.status() == WL_CONNECTED;
}

String getWiFiReconnectStats() {
  String stats = "disconnections=" + String(reconnectState.totalDisconnections);
  stats += " attempts=" + String(reconnectState.reconnectAttempts);
  stats += " delay=" + String(reconnectState.reconnectDelay) + "ms";
  stats += " reconnecting=" + String(reconnectState.isReconnecting ? "yes" : "no");
  return stats;
}
