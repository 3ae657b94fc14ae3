#include "server/sandbox/execution_service.hpp"

namespace gradeguard::server {

bool stage_result::succeeded() const {
    return code && *code == 0 && !signal;
}

}  // namespace gradeguard::server
