 /**
 * @file cloudless_log_macros.h
 * @brief Per-module logging macros shared by the cloudless sources.
 *
 * In TESTING builds the presence and router macros embed the `this` pointer so
 * that log lines from registries created by different test fixtures can be told apart.
 */

#ifndef CLOUDLESS_LOG_MACROS_H
#define CLOUDLESS_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_PRESENCE_DEBUG(message) LOG_DEBUG("presence", "[pointer: " << this << "] " << message)
#define LOG_PRESENCE_INFO(message)  LOG_INFO("presence", "[pointer: " << this << "] " << message)
#define LOG_PRESENCE_WARN(message)  LOG_WARN("presence", "[pointer: " << this << "] " << message)
#define LOG_PRESENCE_ERROR(message) LOG_ERROR("presence", "[pointer: " << this << "] " << message)

#define LOG_ROUTER_DEBUG(message) LOG_DEBUG("router", "[pointer: " << this << "] " << message)
#define LOG_ROUTER_INFO(message)  LOG_INFO("router", "[pointer: " << this << "] " << message)
#define LOG_ROUTER_WARN(message)  LOG_WARN("router", "[pointer: " << this << "] " << message)
#define LOG_ROUTER_ERROR(message) LOG_ERROR("router", "[pointer: " << this << "] " << message)
#else
#define LOG_PRESENCE_DEBUG(message) LOG_DEBUG("presence", message)
#define LOG_PRESENCE_INFO(message)  LOG_INFO("presence", message)
#define LOG_PRESENCE_WARN(message)  LOG_WARN("presence", message)
#define LOG_PRESENCE_ERROR(message) LOG_ERROR("presence", message)

#define LOG_ROUTER_DEBUG(message) LOG_DEBUG("router", message)
#define LOG_ROUTER_INFO(message)  LOG_INFO("router", message)
#define LOG_ROUTER_WARN(message)  LOG_WARN("router", message)
#define LOG_ROUTER_ERROR(message) LOG_ERROR("router", message)
#endif

#define LOG_TRANSFER_DEBUG(message) LOG_DEBUG("transfer", message)
#define LOG_TRANSFER_INFO(message)  LOG_INFO("transfer", message)
#define LOG_TRANSFER_WARN(message)  LOG_WARN("transfer", message)
#define LOG_TRANSFER_ERROR(message) LOG_ERROR("transfer", message)

#define LOG_REAPER_DEBUG(message) LOG_DEBUG("reaper", message)
#define LOG_REAPER_INFO(message)  LOG_INFO("reaper", message)
#define LOG_REAPER_WARN(message)  LOG_WARN("reaper", message)
#define LOG_REAPER_ERROR(message) LOG_ERROR("reaper", message)

#define LOG_ROOM_DEBUG(message) LOG_DEBUG("room", message)
#define LOG_ROOM_INFO(message)  LOG_INFO("room", message)
#define LOG_ROOM_WARN(message)  LOG_WARN("room", message)
#define LOG_ROOM_ERROR(message) LOG_ERROR("room", message)

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_WARN(message)  LOG_WARN("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#define LOG_SERVER_DEBUG(message) LOG_DEBUG("server", message)
#define LOG_SERVER_INFO(message)  LOG_INFO("server", message)
#define LOG_SERVER_WARN(message)  LOG_WARN("server", message)
#define LOG_SERVER_ERROR(message) LOG_ERROR("server", message)

#endif // CLOUDLESS_LOG_MACROS_H
