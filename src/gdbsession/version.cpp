#include "gdbsession/gdbsession.hpp"

#ifndef GDBSESSION_VERSION
#define GDBSESSION_VERSION "0.0.0"
#endif

namespace gdbsession {

std::string_view version() { return GDBSESSION_VERSION; }

} // namespace gdbsession
