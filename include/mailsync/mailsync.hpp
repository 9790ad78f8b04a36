/*

mailsync.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/timeout.hpp>

#include <mailsync/net/dialog.hpp>
#include <mailsync/net/tls_mode.hpp>
#include <mailsync/net/tls_options.hpp>
#include <mailsync/net/upgradable_stream.hpp>

#include <mailsync/oauth2/token_source.hpp>

#include <mailsync/imap/types.hpp>
#include <mailsync/imap/search.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/imap/connection.hpp>
#include <mailsync/imap/client.hpp>
#include <mailsync/imap/idle.hpp>

// Accounts and client pool
#include <mailsync/accounts/account.hpp>
#include <mailsync/accounts/account_manager.hpp>

// Synchronisation
#include <mailsync/sync/types.hpp>
#include <mailsync/sync/storage.hpp>
#include <mailsync/sync/memory_storage.hpp>
#include <mailsync/sync/sync_engine.hpp>

// Background work
#include <mailsync/scheduler/task.hpp>
#include <mailsync/scheduler/background_scheduler.hpp>
#include <mailsync/scheduler/sync_task_runner.hpp>
