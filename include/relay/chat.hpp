#pragma once

//
// relay-chat: convenience header
//
// Usage:
//   #include <relay/chat.hpp>
//
// This pulls in the main building blocks:
//
//   - relay::chat::Server             → relay entry point (hub + accept engine)
//   - relay::chat::Hub                → membership, fan-out, command handling
//   - relay::chat::Session            → per-connection reader/writer pumps
//   - relay::chat::Command            → decoded client commands
//   - relay::chat::IMessageStore      → abstract storage interface
//   - relay::chat::MemoryMessageStore → in-process log (default)
//   - relay::chat::SqliteMessageStore → SQLite + WAL implementation
//

#include <relay/chat/config.hpp>
#include <relay/chat/protocol.hpp>
#include <relay/chat/client.hpp>
#include <relay/chat/hub.hpp>
#include <relay/chat/server.hpp>
#include <relay/chat/session.hpp>
#include <relay/chat/MessageStore.hpp>
#include <relay/chat/MemoryMessageStore.hpp>
#include <relay/chat/SqliteMessageStore.hpp>
#include <relay/chat/Metrics.hpp>
