#include "websocket_transport.h"
#include "production_logger.h"

bool parseWebSocketUrl(const String& url, WebSocketUrl& out) {
  String rest;
  if (url.startsWith("wss://")) {
    out.secure = true;
    out.port = 443;
    rest = url.substring(6);
  } else if (url.startsWith("ws://")) {
    out.secure = false;
    out.port = 80;
    rest = url.substring(5);
  } else {
    return false;
  }

  int slash = rest.indexOf('/');
  String authority = slash < 0 ? rest : rest.substring(0, slash);
  out.path = slash < 0 ? String("/") : rest.substring(slash);

  int colon = authority.indexOf(':');
  if (colon >= 0) {
    long port = authority.substring(colon + 1).toInt();
    if (port <= 0 || port > 65535) return false;
    out.port = (uint16_t)port;
    out.host = authority.substring(0, colon);
  } else {
    out.host = authority;
  }
  return out.host.length() > 0;
}

WebSocketTransport::WebSocketTransport(const char* name)
  : name(name),
    started(false),
    connected(false),
    closing(false),
    openedAt(0),
    messagesSent(0),
    messagesReceived(0) {}

bool WebSocketTransport::open(const String& url, const String& bearerToken) {
  WebSocketUrl target;
  if (!parseWebSocketUrl(url, target)) {
    VB_LOG_ERROR(LOG_NETWORK, String(name) + ": invalid WebSocket URL", url);
    return false;
  }

  if (started) {
    stop();
  }

  // The token travels both as a header and as a sub-protocol so either
  // handshake style is accepted by the endpoint
  extraHeaders = "";
  protocols = "arduino";
  if (bearerToken.length() > 0) {
    extraHeaders = "Authorization: Bearer " + bearerToken;
    protocols = "realtime, openai-insecure-api-key." + bearerToken;
  }
  client.setExtraHeaders(extraHeaders.length() > 0 ? extraHeaders.c_str() : NULL);

  if (target.secure) {
    client.beginSslWithCA(target.host.c_str(), target.port, target.path.c_str(),
                          caCert.length() > 0 ? caCert.c_str() : NULL, protocols.c_str());
  } else {
    client.begin(target.host.c_str(), target.port, target.path.c_str(), protocols.c_str());
  }

  client.onEvent([this](WStype_t type, uint8_t* payload, size_t length) {
    handleEvent(type, payload, length);
  });
  client.setReconnectInterval(0xFFFFFFFF);
  client.enableHeartbeat(15000, 3000, 2);

  started = true;
  connected = false;
  closing = false;
  openedAt = millis();
  VB_LOG_INFO(LOG_NETWORK, String(name) + ": connecting",
              String(target.secure ? "wss://" : "ws://") + target.host + ":" + String(target.port) + target.path);
  return true;
}

bool WebSocketTransport::send(const String& text) {
  if (!connected) return false;
  if (!client.sendTXT(text.c_str())) {
    VB_LOG_WARNING(LOG_NETWORK, String(name) + ": send failed", "bytes=" + String(text.length()));
    return false;
  }
  messagesSent++;
  return true;
}

void WebSocketTransport::close() {
  if (!started) return;
  closing = true;
  client.disconnect();
  closing = false;
  stop();
}

void WebSocketTransport::stop() {
  started = false;
  connected = false;
}

void WebSocketTransport::loop() {
  if (!started) return;
  client.loop();

  // A refused handshake produces no event, so a stalled connect counts as lost
  if (started && !connected && millis() - openedAt > VB_WS_CONNECT_TIMEOUT_MS) {
    VB_LOG_WARNING(LOG_NETWORK, String(name) + ": connect timed out");
    closing = true;
    client.disconnect();
    closing = false;
    stop();
    if (closeHandler) closeHandler();
  }
}

void WebSocketTransport::handleEvent(WStype_t type, uint8_t* payload, size_t length) {
  switch (type) {
    case WStype_CONNECTED:
      if (closing) break;
      connected = true;
      VB_LOG_INFO(LOG_NETWORK, String(name) + ": connected");
      if (openHandler) openHandler();
      break;

    case WStype_TEXT:
      messagesReceived++;
      if (messageHandler && !closing) messageHandler((const char*)payload, length);
      break;

    case WStype_DISCONNECTED: {
      bool requested = closing;
      bool wasStarted = started;
      closing = false;
      stop();
      if (requested) {
        VB_LOG_DEBUG(LOG_NETWORK, String(name) + ": closed");
        break;
      }
      if (wasStarted) {
        VB_LOG_WARNING(LOG_NETWORK, String(name) + ": connection lost");
        if (closeHandler) closeHandler();
      }
      break;
    }

    case WStype_ERROR:
      VB_LOG_ERROR(LOG_NETWORK, String(name) + ": socket error",
                   length > 0 ? String((const char*)payload).substring(0, 64) : String(""));
      if (errorHandler) errorHandler("socket error");
      break;

    case WStype_BIN:
      VB_LOG_DEBUG(LOG_NETWORK, String(name) + ": ignoring binary frame", "bytes=" + String(length));
      break;

    default:
      break;
  }
}
