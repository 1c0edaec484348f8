/// @file offsync.hpp
/// @brief Umbrella header for the offsync-cpp library.
///
/// Include this single header for access to all public types:
/// Repository, RecordStore, OperationLog, SyncOrchestrator, the remote
/// and connectivity interfaces, conflict resolvers, and configuration.

#pragma once

#include <offsync-cpp/backoff.hpp>
#include <offsync-cpp/config.hpp>
#include <offsync-cpp/conflict_resolver.hpp>
#include <offsync-cpp/connectivity.hpp>
#include <offsync-cpp/error.hpp>
#include <offsync-cpp/in_memory_remote.hpp>
#include <offsync-cpp/log.hpp>
#include <offsync-cpp/operation.hpp>
#include <offsync-cpp/operation_log.hpp>
#include <offsync-cpp/record.hpp>
#include <offsync-cpp/record_store.hpp>
#include <offsync-cpp/remote_gateway.hpp>
#include <offsync-cpp/repository.hpp>
#include <offsync-cpp/subscription.hpp>
#include <offsync-cpp/sync_orchestrator.hpp>
#include <offsync-cpp/types.hpp>
