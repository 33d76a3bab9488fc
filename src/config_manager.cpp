#include "config_manager.h"
#include "production_logger.h"
#include <Preferences.h>

static Preferences configPrefs;
ConfigManager configManager;

bool ConfigManager::init() {
    if (!configPrefs.begin("vb-config", false)) {
        VB_LOG_CRITICAL(LOG_CONFIG, "Failed to open NVS namespace", "vb-config");
        applyDefaults(config);
        return false;
    }

    if (!configPrefs.getBool("initialized", false)) {
        VB_LOG_INFO(LOG_CONFIG, "First boot, writing default configuration");
        initializeDefaultConfig();
    }

    loadConfiguration();
    if (!validate()) {
        VB_LOG_WARNING(LOG_CONFIG, "Configuration incomplete, calls disabled until provisioned");
    }

    ProductionLogger::setLogLevel((LogLevel)config.log_level);
    initialized = true;
    return true;
}

void ConfigManager::applyDefaults(BridgeConfig& cfg) {
    cfg.wifi_ssid = "";
    cfg.wifi_password = "";
    cfg.api_base_url = DEFAULT_API_BASE_URL;
    cfg.api_token = "";
    cfg.realtime_url = DEFAULT_REALTIME_URL;
    cfg.workspace_id = "";
    cfg.agent_id = "";
    cfg.ca_cert = "";
    cfg.bridge_mode = DEFAULT_BRIDGE_MODE;
    cfg.telephony_relay_url = DEFAULT_TELEPHONY_RELAY_URL;
    cfg.use_aa_filter = true;
    cfg.flush_threshold_bytes = VB_PLAYBACK_FLUSH_THRESHOLD;
    cfg.flush_timeout_ms = VB_PLAYBACK_FLUSH_TIMEOUT_MS;
    cfg.capture_interval_ms = VB_CAPTURE_INTERVAL_MS;
    cfg.speech_start_debounce_ms = VB_SPEECH_START_DEBOUNCE_MS;
    cfg.speech_stop_debounce_ms = VB_SPEECH_STOP_DEBOUNCE_MS;
    cfg.reconnect_base_delay_ms = VB_RECONNECT_BASE_DELAY_MS;
    cfg.max_reconnect_attempts = VB_MAX_RECONNECT_ATTEMPTS;
    cfg.log_level = DEFAULT_LOG_LEVEL;
    cfg.configured = false;
}

void ConfigManager::initializeDefaultConfig() {
    applyDefaults(config);
    saveConfiguration();
    configPrefs.putBool("initialized", true);
}

void ConfigManager::loadConfiguration() {
    BridgeConfig defaults;
    applyDefaults(defaults);

    config.wifi_ssid = configPrefs.getString("wifi_ssid", defaults.wifi_ssid);
    config.wifi_password = configPrefs.getString("wifi_password", defaults.wifi_password);
    config.api_base_url = configPrefs.getString("api_base_url", defaults.api_base_url);
    config.api_token = configPrefs.getString("api_token", defaults.api_token);
    config.realtime_url = configPrefs.getString("realtime_url", defaults.realtime_url);
    config.workspace_id = configPrefs.getString("workspace_id", defaults.workspace_id);
    config.agent_id = configPrefs.getString("agent_id", defaults.agent_id);
    config.ca_cert = configPrefs.getString("ca_cert", defaults.ca_cert);
    config.bridge_mode = configPrefs.getInt("bridge_mode", defaults.bridge_mode);
    config.telephony_relay_url = configPrefs.getString("relay_url", defaults.telephony_relay_url);
    config.use_aa_filter = configPrefs.getBool("aa_filter", defaults.use_aa_filter);
    config.flush_threshold_bytes = configPrefs.getInt("flush_bytes", defaults.flush_threshold_bytes);
    config.flush_timeout_ms = configPrefs.getInt("flush_ms", defaults.flush_timeout_ms);
    config.capture_interval_ms = configPrefs.getInt("capture_ms", defaults.capture_interval_ms);
    config.speech_start_debounce_ms = configPrefs.getInt("vad_start_ms", defaults.speech_start_debounce_ms);
    config.speech_stop_debounce_ms = configPrefs.getInt("vad_stop_ms", defaults.speech_stop_debounce_ms);
    config.reconnect_base_delay_ms = configPrefs.getInt("reconn_base_ms", defaults.reconnect_base_delay_ms);
    config.max_reconnect_attempts = configPrefs.getInt("reconn_max", defaults.max_reconnect_attempts);
    config.log_level = configPrefs.getInt("log_level", defaults.log_level);
    config.configured = configPrefs.getBool("configured", false);

    printConfiguration();
}

bool ConfigManager::saveConfiguration() {
    size_t written = 0;
    written += configPrefs.putString("wifi_ssid", config.wifi_ssid);
    written += configPrefs.putString("wifi_password", config.wifi_password);
    written += configPrefs.putString("api_base_url", config.api_base_url);
    written += configPrefs.putString("api_token", config.api_token);
    written += configPrefs.putString("realtime_url", config.realtime_url);
    written += configPrefs.putString("workspace_id", config.workspace_id);
    written += configPrefs.putString("agent_id", config.agent_id);
    written += configPrefs.putString("ca_cert", config.ca_cert);
    written += configPrefs.putInt("bridge_mode", config.bridge_mode);
    written += configPrefs.putString("relay_url", config.telephony_relay_url);
    written += configPrefs.putBool("aa_filter", config.use_aa_filter);
    written += configPrefs.putInt("flush_bytes", config.flush_threshold_bytes);
    written += configPrefs.putInt("flush_ms", config.flush_timeout_ms);
    written += configPrefs.putInt("capture_ms", config.capture_interval_ms);
    written += configPrefs.putInt("vad_start_ms", config.speech_start_debounce_ms);
    written += configPrefs.putInt("vad_stop_ms", config.speech_stop_debounce_ms);
    written += configPrefs.putInt("reconn_base_ms", config.reconnect_base_delay_ms);
    written += configPrefs.putInt("reconn_max", config.max_reconnect_attempts);
    written += configPrefs.putInt("log_level", config.log_level);
    written += configPrefs.putBool("configured", config.configured);

    if (written == 0) {
        VB_LOG_ERROR(LOG_CONFIG, "Failed to persist configuration");
        return false;
    }
    return true;
}

bool ConfigManager::validate() {
    BridgeConfig defaults;
    applyDefaults(defaults);

    if (config.flush_threshold_bytes <= 0 || (config.flush_threshold_bytes % 2) != 0) {
        VB_LOG_WARNING(LOG_CONFIG, "Invalid flush threshold, using default", String(config.flush_threshold_bytes));
        config.flush_threshold_bytes = defaults.flush_threshold_bytes;
    }
    if (config.flush_timeout_ms <= 0) {
        config.flush_timeout_ms = defaults.flush_timeout_ms;
    }
    if (config.capture_interval_ms < 20 || config.capture_interval_ms > 1000) {
        VB_LOG_WARNING(LOG_CONFIG, "Invalid capture interval, using default", String(config.capture_interval_ms));
        config.capture_interval_ms = defaults.capture_interval_ms;
    }
    if (config.speech_start_debounce_ms < 0) {
        config.speech_start_debounce_ms = defaults.speech_start_debounce_ms;
    }
    if (config.speech_stop_debounce_ms < 0) {
        config.speech_stop_debounce_ms = defaults.speech_stop_debounce_ms;
    }
    if (config.reconnect_base_delay_ms <= 0) {
        config.reconnect_base_delay_ms = defaults.reconnect_base_delay_ms;
    }
    if (config.max_reconnect_attempts < 0 || config.max_reconnect_attempts > 10) {
        config.max_reconnect_attempts = defaults.max_reconnect_attempts;
    }
    if (config.bridge_mode != VB_MODE_HANDSET && config.bridge_mode != VB_MODE_TELEPHONY) {
        config.bridge_mode = defaults.bridge_mode;
    }
    if (config.log_level < LOG_NONE || config.log_level > LOG_DEBUG) {
        config.log_level = defaults.log_level;
    }

    config.configured = isWiFiConfigured() && isCallConfigured();
    return config.configured;
}

bool ConfigManager::isWiFiConfigured() const {
    return config.wifi_ssid.length() > 0;
}

bool ConfigManager::isCallConfigured() const {
    if (config.realtime_url.length() == 0) return false;
    if (config.bridge_mode == VB_MODE_TELEPHONY && config.telephony_relay_url.length() == 0) return false;
    return config.api_base_url.length() > 0 &&
           config.api_token.length() > 0 &&
           config.workspace_id.length() > 0 &&
           config.agent_id.length() > 0;
}

bool ConfigManager::setWiFiCredentials(const String& ssid, const String& password) {
    if (ssid.length() == 0 || ssid.length() > 32) {
        VB_LOG_ERROR(LOG_CONFIG, "Rejected WiFi SSID", "length=" + String(ssid.length()));
        return false;
    }
    config.wifi_ssid = ssid;
    config.wifi_password = password;
    validate();
    return saveConfiguration();
}

bool ConfigManager::setBackend(const String& apiBaseUrl, const String& apiToken) {
    if (!apiBaseUrl.startsWith("http://") && !apiBaseUrl.startsWith("https://")) {
        VB_LOG_ERROR(LOG_CONFIG, "Rejected API base URL", apiBaseUrl);
        return false;
    }
    config.api_base_url = apiBaseUrl;
    config.api_token = apiToken;
    validate();
    return saveConfiguration();
}

bool ConfigManager::setAgent(const String& workspaceId, const String& agentId) {
    if (workspaceId.length() == 0 || agentId.length() == 0) {
        VB_LOG_ERROR(LOG_CONFIG, "Workspace and agent ids are required");
        return false;
    }
    config.workspace_id = workspaceId;
    config.agent_id = agentId;
    validate();
    return saveConfiguration();
}

bool ConfigManager::setBridgeMode(int mode, const String& relayUrl) {
    if (mode != VB_MODE_HANDSET && mode != VB_MODE_TELEPHONY) {
        VB_LOG_ERROR(LOG_CONFIG, "Unknown bridge mode", String(mode));
        return false;
    }
    config.bridge_mode = mode;
    if (relayUrl.length() > 0) {
        config.telephony_relay_url = relayUrl;
    }
    validate();
    return saveConfiguration();
}

void ConfigManager::resetConfiguration() {
    configPrefs.clear();
    initializeDefaultConfig();
    VB_LOG_INFO(LOG_CONFIG, "Configuration reset to defaults");
}

BridgeConfig& ConfigManager::getConfig() {
    return config;
}

void ConfigManager::printConfiguration() {
    VB_LOG_INFO(LOG_CONFIG, "Environment", ENVIRONMENT_MODE);
    VB_LOG_INFO(LOG_CONFIG, "WiFi SSID", config.wifi_ssid.length() > 0 ? config.wifi_ssid : String("NOT_SET"));
    VB_LOG_INFO(LOG_CONFIG, "API base", config.api_base_url);
    VB_LOG_INFO(LOG_CONFIG, "API token", config.api_token.length() > 0 ? "SET" : "NOT_SET");
    VB_LOG_INFO(LOG_CONFIG, "Realtime URL", config.realtime_url);
    VB_LOG_INFO(LOG_CONFIG, "Agent", config.workspace_id + "/" + config.agent_id);
    VB_LOG_INFO(LOG_CONFIG, "CA certificate", config.ca_cert.length() > 0 ? "SET" : "NOT_SET");
    VB_LOG_INFO(LOG_CONFIG, "Bridge mode", config.bridge_mode == VB_MODE_TELEPHONY ? "telephony" : "handset");
}
