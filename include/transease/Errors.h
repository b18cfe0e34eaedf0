/**
 * @file Errors.h
 * @brief Exception types raised inside the control plane
 *
 * None of these cross the public boundaries: ConfigStore::save() turns
 * them into a false return, ServerSupervisor turns them into Error events.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace TransEase {

/// Invalid port, out-of-range value or uncreatable root path in a settings update.
class ConfigValidationError : public std::runtime_error {
public:
    explicit ConfigValidationError(const std::string& what) : std::runtime_error(what) {}
};

/// Listening socket could not be created or bound (address in use, permission denied, bad address).
class ServerBindError : public std::runtime_error {
public:
    explicit ServerBindError(const std::string& what) : std::runtime_error(what) {}
};

/// Supervisor-level failure while serving.
class ServerRuntimeError : public std::runtime_error {
public:
    explicit ServerRuntimeError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace TransEase
