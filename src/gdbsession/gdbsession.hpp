#pragma once

#include <string_view>

#include "gdbsession/breakpoint_registry.hpp"
#include "gdbsession/channel/broadcaster.hpp"
#include "gdbsession/channel/channel.hpp"
#include "gdbsession/debugger/debugger_io.hpp"
#include "gdbsession/debugger/pty_debugger.hpp"
#include "gdbsession/log.hpp"
#include "gdbsession/memory_reader.hpp"
#include "gdbsession/mi/mi_codec.hpp"
#include "gdbsession/mi/mi_payloads.hpp"
#include "gdbsession/model.hpp"
#include "gdbsession/protocol/messages.hpp"
#include "gdbsession/server/server.hpp"
#include "gdbsession/session/registry.hpp"
#include "gdbsession/session/session.hpp"
#include "gdbsession/transport/transport.hpp"
#include "gdbsession/transport/transport_tcp.hpp"
#include "gdbsession/varobj_tree.hpp"

namespace gdbsession {

std::string_view version();

} // namespace gdbsession
