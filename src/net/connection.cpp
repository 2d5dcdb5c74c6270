/// @file connection.cpp
/// @brief Connection state machine

#include <relay/net/connection.hpp>

namespace relay_net {

const char* to_string(PeerMessageType type) {
    switch (type) {
        case PeerMessageType::Text: return "text";
        case PeerMessageType::Binary: return "binary";
        default: return "unknown";
    }
}

Connection::Connection(ConnectionId id,
                       ConnectionKind kind,
                       relay_kernel::ContextId owner,
                       std::string instance_id,
                       std::string script,
                       std::string endpoint,
                       Strand strand,
                       std::shared_ptr<relay_exec::ExecutionQueue> queue)
    : m_id(id)
    , m_kind(kind)
    , m_owner(owner)
    , m_instance_id(std::move(instance_id))
    , m_script(std::move(script))
    , m_endpoint(std::move(endpoint))
    , m_strand(std::move(strand))
    , m_queue(std::move(queue))
{
}

ConnectionState Connection::state() const {
    std::lock_guard lock(m_state_mutex);
    return m_state;
}

bool Connection::transition(ConnectionState to) {
    std::lock_guard lock(m_state_mutex);
    if (!is_valid_transition(m_state, to)) {
        return false;
    }
    m_state = to;
    return true;
}

} // namespace relay_net
