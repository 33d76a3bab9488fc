#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <Arduino.h>
#include "config.h"

// Runtime configuration persisted in NVS
struct BridgeConfig {
    // Network
    String wifi_ssid;
    String wifi_password;

    // Backend and realtime endpoint
    String api_base_url;
    String api_token;       // bearer token for the credential endpoint
    String realtime_url;
    String workspace_id;
    String agent_id;
    String ca_cert;         // PEM root for TLS; empty allows insecure TLS outside production

    // Deployment
    int bridge_mode;        // VB_MODE_HANDSET or VB_MODE_TELEPHONY
    String telephony_relay_url;
    bool use_aa_filter;     // filtered 3x decimation on the telephony uplink

    // Tunables
    int flush_threshold_bytes;
    int flush_timeout_ms;
    int capture_interval_ms;
    int speech_start_debounce_ms;
    int speech_stop_debounce_ms;
    int reconnect_base_delay_ms;
    int max_reconnect_attempts;

    int log_level;
    bool configured;
};

class ConfigManager {
private:
    BridgeConfig config;
    bool initialized = false;

    void initializeDefaultConfig();
    void loadConfiguration();
    void printConfiguration();

public:
    bool init();
    bool saveConfiguration();

    // Returns false if a required field is missing; out-of-range tunables are reset to defaults
    bool validate();

    bool isWiFiConfigured() const;
    bool isCallConfigured() const;

    bool setWiFiCredentials(const String& ssid, const String& password);
    bool setBackend(const String& apiBaseUrl, const String& apiToken);
    bool setAgent(const String& workspaceId, const String& agentId);
    bool setBridgeMode(int mode, const String& relayUrl = "");
    void resetConfiguration();

    BridgeConfig& getConfig();

    // Fills a BridgeConfig with compile-time defaults
    static void applyDefaults(BridgeConfig& cfg);
};

extern ConfigManager configManager;

#endif
