#ifndef SETUP_CONSOLE_H
#define SETUP_CONSOLE_H

#include <Arduino.h>
#include "config_manager.h"

#define SETUP_CONSOLE_MAX_LINE 512

// Line-oriented provisioning over Serial:
//   wifi <ssid> <password>
//   backend <api_base_url> <api_token>
//   agent <workspace_id> <agent_id>
//   mode handset | mode telephony <relay_url>
//   realtime <url>
//   filter on|off
//   status | reset
//
// Returns false for an unknown or malformed command. `reply` is always set.
bool applySetupCommand(const String& line, ConfigManager& manager, String& reply);

// Reads Serial without blocking; call from loop()
void handleSetupConsole();

#endif
