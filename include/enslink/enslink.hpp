#pragma once

#include "enslink/engine/direct_transport.hpp"
#include "enslink/session/session.hpp"

namespace enslink {

    using Value = proxy::Value;
    using ProxyPtr = proxy::ProxyPtr;
    using ExecMode = rpc::ExecMode;
    using StreamState = events::StreamState;

} // namespace enslink
