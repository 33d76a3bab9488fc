#ifndef WEBSOCKET_TRANSPORT_H
#define WEBSOCKET_TRANSPORT_H

#include <Arduino.h>
#include <WebSocketsClient.h>
#include "realtime_transport.h"

// RealtimeTransport over links2004 WebSocketsClient. The library's own
// auto-reconnect is disabled; reconnection policy belongs to the caller.
class WebSocketTransport : public RealtimeTransport {
public:
  explicit WebSocketTransport(const char* name);

  bool open(const String& url, const String& bearerToken) override;
  bool send(const String& text) override;
  void close() override;
  bool isOpen() const override { return connected; }
  void loop() override;

  // PEM root used for wss:// endpoints; empty skips verification
  void setCACert(const String& pem) { caCert = pem; }

  unsigned long getMessagesSent() const { return messagesSent; }
  unsigned long getMessagesReceived() const { return messagesReceived; }

private:
  WebSocketsClient client;
  const char* name;
  String extraHeaders;
  String protocols;
  String caCert;
  bool started;
  bool connected;
  bool closing;
  unsigned long openedAt;
  unsigned long messagesSent;
  unsigned long messagesReceived;

  void handleEvent(WStype_t type, uint8_t* payload, size_t length);
  void stop();
};

#endif
