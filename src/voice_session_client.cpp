#include "voice_session_client.h"
#include "production_logger.h"
#include <ArduinoJson.h>
#include <HTTPClient.h>
#include <WiFiClientSecure.h>

VoiceSessionClient::VoiceSessionClient(const String& apiBaseUrl, const String& apiToken, const String& caCert)
  : apiBaseUrl(apiBaseUrl), apiToken(apiToken), caCert(caCert), lastStatusCode(0) {
  while (this->apiBaseUrl.endsWith("/")) {
    this->apiBaseUrl.remove(this->apiBaseUrl.length() - 1);
  }
}

String VoiceSessionClient::buildRequestBody(const String& workspaceId, const String& agentId) {
  StaticJsonDocument<256> doc;
  doc["workspace_id"] = workspaceId.c_str();
  doc["agent_id"] = agentId.c_str();
  String body;
  serializeJson(doc, body);
  return body;
}

bool VoiceSessionClient::parseGrant(const String& body, VoiceSessionGrant& grant) {
  DynamicJsonDocument doc(body.length() + 1024);
  DeserializationError error = deserializeJson(doc, body);
  if (error) {
    VB_LOG_ERROR(LOG_NETWORK, "Voice session response is not JSON", error.c_str());
    return false;
  }

  const char* token = doc["token"] | "";
  if (strlen(token) == 0) {
    VB_LOG_ERROR(LOG_NETWORK, "Voice session response has no token");
    return false;
  }

  grant.token = token;
  grant.expiresAt = (const char*)(doc["expires_at"] | "");

  JsonObject agent = doc["agent"];
  grant.agent.instructions = (const char*)(agent["instructions"] | "");
  grant.agent.voice = (const char*)(agent["voice"] | VB_DEFAULT_VOICE);
  grant.agent.initialGreeting = (const char*)(agent["initial_greeting"] | "");
  JsonArray tools = agent["tools"];
  grant.agent.toolCount = tools.isNull() ? 0 : (int)tools.size();
  grant.agent.temperature = agent["temperature"] | 0.0f;
  grant.agent.maxTokens = agent["max_tokens"] | 0;
  return true;
}

bool VoiceSessionClient::requestSession(const String& workspaceId, const String& agentId, VoiceSessionGrant& grant) {
  String url = apiBaseUrl + "/voice/session";
  HTTPClient http;
  WiFiClientSecure secureClient;
  bool begun;

  if (url.startsWith("https://")) {
    if (caCert.length() > 0) {
      secureClient.setCACert(caCert.c_str());
    } else {
#if PRODUCTION_MODE
      VB_LOG_CRITICAL(LOG_NETWORK, "No CA certificate configured for HTTPS credential endpoint");
      return false;
#else
      secureClient.setInsecure();
#endif
    }
    begun = http.begin(secureClient, url);
  } else {
    begun = http.begin(url);
  }

  if (!begun) {
    VB_LOG_ERROR(LOG_NETWORK, "Cannot reach credential endpoint", url);
    return false;
  }

  http.addHeader("Content-Type", "application/json");
  http.addHeader("Authorization", "Bearer " + apiToken);
  http.addHeader("User-Agent", String(FIRMWARE_NAME) + "/" + FIRMWARE_VERSION);
  http.setTimeout(VB_HTTP_TIMEOUT_MS);

  lastStatusCode = http.POST(buildRequestBody(workspaceId, agentId));
  String response = lastStatusCode > 0 ? http.getString() : String();
  http.end();

  if (lastStatusCode <= 0) {
    VB_LOG_ERROR(LOG_NETWORK, "Credential request failed", HTTPClient::errorToString(lastStatusCode));
    return false;
  }
  if (lastStatusCode != 200 && lastStatusCode != 201) {
    VB_LOG_ERROR(LOG_NETWORK, "Credential request rejected", "status=" + String(lastStatusCode));
    return false;
  }

  if (!parseGrant(response, grant)) {
    return false;
  }
  VB_LOG_INFO(LOG_SESSION, "Voice session granted", "voice=" + grant.agent.voice + " expires=" + grant.expiresAt);
  return true;
}
