#include "config.hpp"

namespace gradeguard {

int COMPILE_TIMEOUT_MS = 10000;  // 10s
int RUN_TIMEOUT_MS = 3000;       // 3s
int TRANSPORT_SLACK_MS = 5000;   // 5s
bool DEBUG = false;

}  // namespace gradeguard
