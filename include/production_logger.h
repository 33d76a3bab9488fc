#ifndef PRODUCTION_LOGGER_H
#define PRODUCTION_LOGGER_H

#include <Arduino.h>
#include <SPIFFS.h>
#include <ArduinoJson.h>
#include <Preferences.h>
#include "config.h"

// Leveled logger: Serial in development, SPIFFS file for errors everywhere

enum LogLevel {
  LOG_NONE = 0,
  LOG_CRITICAL = 1,  // call cannot proceed, device fault
  LOG_ERROR = 2,     // operation failed, call may recover
  LOG_WARNING = 3,
  LOG_INFO = 4,
  LOG_DEBUG = 5
};

enum LogCategory {
  LOG_SYSTEM = 0,
  LOG_NETWORK = 1,   // WiFi, WebSocket, HTTP
  LOG_AUDIO = 2,     // capture, playback, I2S
  LOG_SESSION = 3,   // call state machine, realtime protocol
  LOG_CODEC = 4,
  LOG_CONFIG = 5
};

struct LogEntry {
  unsigned long timestamp;
  LogLevel level;
  LogCategory category;
  String message;
  String context;
};

class ProductionLogger {
private:
  static LogLevel currentLogLevel;
  static bool logToFile;
  static bool logToSerial;
  static String logFileName;
  static int maxLogFileSize;
  static Preferences logPrefs;

  static void log(LogLevel level, LogCategory category, const String& message, const String& context);
  static void rotateLogFile();
  static void writeToFile(const LogEntry& entry);
  static String formatLogEntry(const LogEntry& entry);
  static void emergencyLog(const String& message); // never filtered
  static int getLogFileSize();

public:
  static void init();

  static void logCritical(LogCategory category, const String& message, const String& context = "");
  static void logError(LogCategory category, const String& message, const String& context = "");
  static void logWarning(LogCategory category, const String& message, const String& context = "");
  static void logInfo(LogCategory category, const String& message, const String& context = "");
  static void logDebug(LogCategory category, const String& message, const String& context = "");

  static void logSystemStatus(const String& component, bool healthy, const String& details = "");

  static void setLogLevel(LogLevel level);

  static String getCategoryName(LogCategory category);
  static String getLevelName(LogLevel level);
};

#if PRODUCTION_MODE
  #define VB_LOG_CRITICAL(category, message, ...) ProductionLogger::logCritical(category, message, ##__VA_ARGS__)
  #define VB_LOG_ERROR(category, message, ...) ProductionLogger::logError(category, message, ##__VA_ARGS__)
  #define VB_LOG_WARNING(category, message, ...)
  #define VB_LOG_INFO(category, message, ...)
  #define VB_LOG_DEBUG(category, message, ...)
#else
  #define VB_LOG_CRITICAL(category, message, ...) ProductionLogger::logCritical(category, message, ##__VA_ARGS__)
  #define VB_LOG_ERROR(category, message, ...) ProductionLogger::logError(category, message, ##__VA_ARGS__)
  #define VB_LOG_WARNING(category, message, ...) ProductionLogger::logWarning(category, message, ##__VA_ARGS__)
  #define VB_LOG_INFO(category, message, ...) ProductionLogger::logInfo(category, message, ##__VA_ARGS__)
  #define VB_LOG_DEBUG(category, message, ...) ProductionLogger::logDebug(category, message, ##__VA_ARGS__)
#endif

#endif
