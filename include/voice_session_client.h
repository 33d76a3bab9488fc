#ifndef VOICE_SESSION_CLIENT_H
#define VOICE_SESSION_CLIENT_H

#include <Arduino.h>
#include "realtime_protocol.h"

// Short-lived credential for one realtime session plus the agent persona
struct VoiceSessionGrant {
  String token;
  String expiresAt;
  AgentProfile agent;
};

class CredentialProvider {
public:
  virtual ~CredentialProvider() {}
  virtual bool requestSession(const String& workspaceId, const String& agentId, VoiceSessionGrant& grant) = 0;
};

// POST {api_base}/voice/session over HTTPClient
class VoiceSessionClient : public CredentialProvider {
public:
  VoiceSessionClient(const String& apiBaseUrl, const String& apiToken, const String& caCert = "");

  bool requestSession(const String& workspaceId, const String& agentId, VoiceSessionGrant& grant) override;


  static String buildRequestBody(const String& workspaceId, const String& agentId);
  // false if the body is not JSON or carries no token
  static bool parseGrant(const String& body, VoiceSessionGrant& grant);

private:
  String apiBaseUrl;
  String apiToken;
  String caCert;
  int lastStatusCode;
};

#endif
