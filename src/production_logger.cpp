#include "production_logger.h"

LogLevel ProductionLogger::currentLogLevel = (LogLevel)DEFAULT_LOG_LEVEL;
bool ProductionLogger::logToFile = true;
bool ProductionLogger::logToSerial = !PRODUCTION_MODE;
String ProductionLogger::logFileName = "/logs/bridge.log";
int ProductionLogger::maxLogFileSize = 32768;
Preferences ProductionLogger::logPrefs;

void ProductionLogger::init() {
  logPrefs.begin("logging", false);

  currentLogLevel = (LogLevel)logPrefs.getInt("log_level", DEFAULT_LOG_LEVEL);
  logToSerial = logPrefs.getBool("log_to_serial", !PRODUCTION_MODE);

  if (!SPIFFS.begin(true)) {
    if (logToSerial) {
      Serial.println("EMERGENCY: Failed to initialize SPIFFS for logging");
    }
    logToFile = false;
  }

  if (logToFile) {
    File root = SPIFFS.open("/logs");
    if (!root || !root.isDirectory()) {
      SPIFFS.mkdir("/logs");
    }
  }

  logInfo(LOG_SYSTEM, "Logger initialized", "level=" + getLevelName(currentLogLevel));
  rotateLogFile();
}

void ProductionLogger::log(LogLevel level, LogCategory category, const String& message, const String& context) {
  if (currentLogLevel < level) return;

  LogEntry entry = {millis(), level, category, message, context};

  if (logToSerial) {
    Serial.println("[" + getLevelName(level) + "] " + formatLogEntry(entry));
  }

  // Only failures are persisted; flash space is kept for post-mortem
  if (logToFile && level <= LOG_ERROR) {
    writeToFile(entry);
  }
}

void ProductionLogger::logCritical(LogCategory category, const String& message, const String& context) {
  log(LOG_CRITICAL, category, message, context);
}

void ProductionLogger::logError(LogCategory category, const String& message, const String& context) {
  log(LOG_ERROR, category, message, context);
}

void ProductionLogger::logWarning(LogCategory category, const String& message, const String& context) {
  log(LOG_WARNING, category, message, context);
}

void ProductionLogger::logInfo(LogCategory category, const String& message, const String& context) {
  log(LOG_INFO, category, message, context);
}

void ProductionLogger::logDebug(LogCategory category, const String& message, const String& context) {
  log(LOG_DEBUG, category, message, context);
}

void ProductionLogger::logSystemStatus(const String& component, bool healthy, const String& details) {
  String message = component + "_STATUS: " + (healthy ? "OK" : "FAILED");
  if (healthy) {
    logInfo(LOG_SYSTEM, message, details);
  } else {
    logError(LOG_SYSTEM, message, details);
  }
}

void ProductionLogger::setLogLevel(LogLevel level) {
  currentLogLevel = level;
  logPrefs.putInt("log_level", (int)level);
}

void ProductionLogger::emergencyLog(const String& message) {
  String emergencyMessage = "[" + String(millis()) + "] EMERGENCY: " + message;
  Serial.println(emergencyMessage);

  File mainLog = SPIFFS.open(logFileName, FILE_APPEND);
  if (mainLog) {
    mainLog.println(emergencyMessage);
    mainLog.close();
  }
}

void ProductionLogger::writeToFile(const LogEntry& entry) {
  if (getLogFileSize() > maxLogFileSize) {
    rotateLogFile();
  }

  File logFile = SPIFFS.open(logFileName, FILE_APPEND);
  if (!logFile) {
    logToFile = false;
    emergencyLog("Failed to open log file: " + entry.message);
    return;
  }

  DynamicJsonDocument logDoc(512);
  logDoc["timestamp"] = entry.timestamp;
  logDoc["level"] = getLevelName(entry.level);
  logDoc["category"] = getCategoryName(entry.category);
  logDoc["message"] = entry.message;
  if (!entry.context.isEmpty()) {
    logDoc["context"] = entry.context;
  }
  logDoc["free_heap"] = ESP.getFreeHeap();

  String line;
  serializeJson(logDoc, line);
  logFile.println(line);
  logFile.close();
}

void ProductionLogger::rotateLogFile() {
  if (!logToFile) return;

  File logFile = SPIFFS.open(logFileName, FILE_READ);
  if (!logFile) return;
  size_t fileSize = logFile.size();
  logFile.close();

  if (fileSize > (size_t)maxLogFileSize) {
    String backupName = "/logs/bridge_backup.log";
    SPIFFS.remove(backupName);
    SPIFFS.rename(logFileName, backupName);
  }
}

String ProductionLogger::formatLogEntry(const LogEntry& entry) {
  String formatted = "[" + String(entry.timestamp) + "] ";
  formatted += getCategoryName(entry.category) + ": ";
  formatted += entry.message;
  if (!entry.context.isEmpty()) {
    formatted += " (" + entry.context + ")";
  }
  return formatted;
}

String ProductionLogger::getCategoryName(LogCategory category) {
  switch (category) {
    case LOG_SYSTEM: return "SYSTEM";
    case LOG_NETWORK: return "NETWORK";
    case LOG_AUDIO: return "AUDIO";
    case LOG_SESSION: return "SESSION";
    case LOG_CODEC: return "CODEC";
    case LOG_CONFIG: return "CONFIG";
    default: return "UNKNOWN";
  }
}

String ProductionLogger::getLevelName(LogLevel level) {
  switch (level) {
    case LOG_CRITICAL: return "CRITICAL";
    case LOG_ERROR: return "ERROR";
    case LOG_WARNING: return "WARNING";
    case LOG_INFO: return "INFO";
    case LOG_DEBUG: return "DEBUG";
    default: return "NONE";
  }
}

int ProductionLogger::getLogFileSize() {
  File logFile = SPIFFS.open(logFileName, FILE_READ);
  if (!logFile) return 0;
  int size = logFile.size();
  logFile.close();
  return size;
}
