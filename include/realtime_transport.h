#ifndef REALTIME_TRANSPORT_H
#define REALTIME_TRANSPORT_H

#include <Arduino.h>
#include <functional>

// Bidirectional text-message socket. Handlers are invoked on the loop task.
class RealtimeTransport {
public:
  typedef std::function<void()> OpenHandler;
  typedef std::function<void(const char* payload, size_t length)> MessageHandler;
  typedef std::function<void()> CloseHandler;
  typedef std::function<void(const String& reason)> ErrorHandler;

  virtual ~RealtimeTransport() {}

  // Starts connecting. An empty token opens without authentication.
  virtual bool open(const String& url, const String& bearerToken) = 0;
  virtual bool send(const String& text) = 0;
  // Normal close frame. The close handler is not invoked for a close
  // requested here, but callers must tolerate one arriving anyway.
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  virtual void loop() {}

  void setHandlers(OpenHandler onOpen, MessageHandler onMessage, CloseHandler onClose, ErrorHandler onError) {
    openHandler = onOpen;
    messageHandler = onMessage;
    closeHandler = onClose;
    errorHandler = onError;
  }

  void clearHandlers() {
    openHandler = nullptr;
    messageHandler = nullptr;
    closeHandler = nullptr;
    errorHandler = nullptr;
  }

protected:
  OpenHandler openHandler;
  MessageHandler messageHandler;
  CloseHandler closeHandler;
  ErrorHandler errorHandler;
};

struct WebSocketUrl {
  bool secure;
  String host;
  uint16_t port;
  String path;
};

// ws://host[:port]/path and wss://host[:port]/path
bool parseWebSocketUrl(const String& url, WebSocketUrl& out);

#endif
