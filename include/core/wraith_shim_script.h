#ifndef WRAITH_SHIM_SCRIPT_H_
#define WRAITH_SHIM_SCRIPT_H_

#include <string>

// File name the control script is written under in the process directory
extern const char kShimScriptName[];

// Control script run by the engine. It serves the /ping, /create and
// /invoke endpoints on 127.0.0.1:<port>, where <port> is the script's last
// command-line argument, and dispatches invocations to the engine's page
// objects.
const std::string& GetShimScript();

#endif  // WRAITH_SHIM_SCRIPT_H_
