/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay.hpp
 * @brief Convenience umbrella header for the prelay print relay library.
 *
 * Including this file pulls in the full public API. Prefer the specific
 * headers in translation units that only need part of it.
 */

#ifndef PRELAY_HPP_
#define PRELAY_HPP_

#include "prelay-async.hpp"
#include "prelay-buffer.hpp"
#include "prelay-config.hpp"
#include "prelay-connection.hpp"
#include "prelay-debug.hpp"
#include "prelay-device-print-sink.hpp"
#include "prelay-error.hpp"
#include "prelay-event-log.hpp"
#include "prelay-event-pb-util.hpp"
#include "prelay-event.hpp"
#include "prelay-io.hpp"
#include "prelay-job.hpp"
#include "prelay-port-guard.hpp"
#include "prelay-print-sink.hpp"
#include "prelay-proc.hpp"
#include "prelay-pub-sub.hpp"
#include "prelay-runtime.hpp"
#include "prelay-server.hpp"
#include "prelay-socket.hpp"

#ifdef PRELAY_HAVE_CUPS
#include "prelay-cups-print-sink.hpp"
#endif

#endif // PRELAY_HPP_
