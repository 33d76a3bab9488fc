#ifndef WIFI_MANAGER_H
#define WIFI_MANAGER_H

#include <Arduino.h>
#include <WiFi.h>

#define WIFI_CONNECT_WINDOW_MS    2000
#define WIFI_ATTEMPT_TIMEOUT_MS   5000
#define WIFI_RECONNECT_INITIAL_MS 500
#define WIFI_RECONNECT_MAX_MS     8000
#define WIFI_CHECK_INTERVAL_MS    1000

bool initWiFiManager();

// One attempt with the stored credentials, bounded by WIFI_CONNECT_WINDOW_MS
bool connectToWiFi();

// Non-blocking reconnect with backoff 0.5s doubling to 8s; call from loop()
void handleWiFiManager();

bool isWiFiConnected();
String getWiFiReconnectStats();

#endif
