#include "setup_console.h"
#include "production_logger.h"

static String consoleLine;

// Splits off the first whitespace-delimited word; `rest` keeps everything after it
static String nextWord(const String& input, String& rest) {
  String trimmed = input;
  trimmed.trim();
  int space = trimmed.indexOf(' ');
  if (space < 0) {
    rest = "";
    return trimmed;
  }
  rest = trimmed.substring(space + 1);
  rest.trim();
  return trimmed.substring(0, space);
}

static String describeConfig(const BridgeConfig& config) {
  String status = "mode=" + String(config.bridge_mode == VB_MODE_TELEPHONY ? "telephony" : "handset");
  status += " wifi=" + (config.wifi_ssid.length() > 0 ? config.wifi_ssid : String("<unset>"));
  status += " api=" + config.api_base_url;
  status += " token=" + String(config.api_token.length() > 0 ? "set" : "unset");
  status += " realtime=" + config.realtime_url;
  status += " agent=" + config.workspace_id + "/" + config.agent_id;
  status += " filter=" + String(config.use_aa_filter ? "on" : "off");
  status += " configured=" + String(config.configured ? "yes" : "no");
  return status;
}

bool applySetupCommand(const String& line, ConfigManager& manager, String& reply) {
  String args;
  String command = nextWord(line, args);
  command.toLowerCase();

  if (command == "wifi") {
    String password;
    String ssid = nextWord(args, password);
    if (ssid.length() == 0) {
      reply = "usage: wifi <ssid> <password>";
      return false;
    }
    bool saved = manager.setWiFiCredentials(ssid, password);
    reply = saved ? "wifi saved, reboot to apply" : "wifi not saved";
    return saved;
  }

  if (command == "backend") {
    String token;
    String url = nextWord(args, token);
    if (url.length() == 0 || token.length() == 0) {
      reply = "usage: backend <api_base_url> <api_token>";
      return false;
    }
    bool saved = manager.setBackend(url, token);
    reply = saved ? "backend saved" : "backend not saved";
    return saved;
  }

  if (command == "agent") {
    String agentId;
    String workspaceId = nextWord(args, agentId);
    if (workspaceId.length() == 0 || agentId.length() == 0) {
      reply = "usage: agent <workspace_id> <agent_id>";
      return false;
    }
    bool saved = manager.setAgent(workspaceId, agentId);
    reply = saved ? "agent saved" : "agent not saved";
    return saved;
  }

  if (command == "mode") {
    String relayUrl;
    String mode = nextWord(args, relayUrl);
    bool saved;
    if (mode == "handset") {
      saved = manager.setBridgeMode(VB_MODE_HANDSET);
    } else if (mode == "telephony" && relayUrl.length() > 0) {
      saved = manager.setBridgeMode(VB_MODE_TELEPHONY, relayUrl);
    } else {
      reply = "usage: mode handset | mode telephony <relay_url>";
      return false;
    }
    reply = saved ? "mode saved, reboot to apply" : "mode not saved";
    return saved;
  }

  if (command == "realtime") {
    if (!args.startsWith("ws://") && !args.startsWith("wss://")) {
      reply = "usage: realtime <ws[s]://host/path>";
      return false;
    }
    manager.getConfig().realtime_url = args;
    bool saved = manager.saveConfiguration();
    reply = saved ? "realtime url saved" : "realtime url not saved";
    return saved;
  }

  if (command == "filter") {
    if (args != "on" && args != "off") {
      reply = "usage: filter on|off";
      return false;
    }
    manager.getConfig().use_aa_filter = args == "on";
    bool saved = manager.saveConfiguration();
    reply = saved ? "filter saved" : "filter not saved";
    return saved;
  }

  if (command == "status") {
    manager.validate();
    reply = describeConfig(manager.getConfig());
    return true;
  }

  if (command == "reset") {
    manager.resetConfiguration();
    reply = "configuration reset";
    return true;
  }

  reply = "unknown command: " + command;
  return false;
}

void handleSetupConsole() {
  while (Serial.available()) {
    char c = Serial.read();
    if (c == '\n' || c == '\r') {
      if (consoleLine.length() == 0) continue;

      String reply;
      if (!applySetupCommand(consoleLine, configManager, reply)) {
        VB_LOG_WARNING(LOG_CONFIG, "Setup command rejected", consoleLine);
      }
      Serial.println(reply);
      consoleLine = "";
    } else if (c >= 32 && c <= 126 && consoleLine.length() < SETUP_CONSOLE_MAX_LINE) {
      consoleLine += c;
    }
  }
}
