#pragma once

// gatehouse: extension host gateway with event-routed RPC.

#include "config.hpp"
#include "dispatcher.hpp"
#include "error.hpp"
#include "events.hpp"
#include "extension.hpp"
#include "host.hpp"
#include "log.hpp"
#include "manager.hpp"
#include "process.hpp"
#include "protocol.hpp"
#include "runtime.hpp"
#include "schema.hpp"
#include "transport.hpp"
