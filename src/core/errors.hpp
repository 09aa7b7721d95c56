#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace plughost {

// Base for every error raised by the adapter runtime and the RPC layer.
// name() travels over the wire so the caller can tell error kinds apart.
class Error : public std::runtime_error {
public:
    Error(std::string name, const std::string& message, std::string code = {})
        : std::runtime_error(message), name_(std::move(name)), code_(std::move(code)) {}

    const std::string& name() const { return name_; }
    const std::string& code() const { return code_; }

    // Whether repeating the same call may succeed
    virtual bool retryable() const { return false; }

private:
    std::string name_;
    std::string code_;
};

// Invalid adapter configuration: missing dependency, cycle, bad manifest,
// unknown module or failing factory. Aborts the whole load.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message,
                                std::vector<std::string> tokens = {})
        : Error("ConfigurationError", message, "E_CONFIG"), tokens_(std::move(tokens)) {}

    // Runtime tokens the error is about
    const std::vector<std::string>& tokens() const { return tokens_; }

private:
    std::vector<std::string> tokens_;
};

// Connection-level failure between a transport and the host.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message, std::string code = "E_TRANSPORT")
        : Error("TransportError", message, std::move(code)) {}

    bool retryable() const override { return true; }

protected:
    TransportError(std::string name, const std::string& message, std::string code)
        : Error(std::move(name), message, std::move(code)) {}
};

// The caller gave up waiting. The host is not told and may still finish the call.
class TimeoutError : public TransportError {
public:
    TimeoutError(const std::string& message, uint64_t timeout_ms)
        : TransportError("TimeoutError", message, "ETIMEDOUT"), timeout_ms_(timeout_ms) {}

    uint64_t timeout_ms() const { return timeout_ms_; }

private:
    uint64_t timeout_ms_;
};

// Rejected locally because the circuit breaker is open.
class CircuitOpenError : public TransportError {
public:
    explicit CircuitOpenError(const std::string& message)
        : TransportError("CircuitOpenError", message, "E_CIRCUIT_OPEN") {}
};

class AdapterNotFoundError : public Error {
public:
    explicit AdapterNotFoundError(const std::string& message)
        : Error("AdapterNotFoundError", message, "E_ADAPTER_NOT_FOUND") {}
};

class MethodNotFoundError : public Error {
public:
    explicit MethodNotFoundError(const std::string& message)
        : Error("MethodNotFoundError", message, "E_METHOD_NOT_FOUND") {}
};

// An error raised by the adapter method itself, re-raised on the caller side.
class ApplicationError : public Error {
public:
    ApplicationError(std::string name, const std::string& message,
                     std::string code = {}, std::string remote_stack = {})
        : Error(std::move(name), message, std::move(code)),
          remote_stack_(std::move(remote_stack)) {}

    const std::string& remote_stack() const { return remote_stack_; }

private:
    std::string remote_stack_;
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message)
        : Error("SerializationError", message, "E_SERIALIZE") {}
};

class DeserializationError : public Error {
public:
    explicit DeserializationError(const std::string& message)
        : Error("DeserializationError", message, "E_DESERIALIZE") {}
};

// Transport, timeout and circuit-open failures are retryable; everything
// else, including application errors and foreign exceptions, is not.
bool is_retryable(const std::exception& error);

} // namespace plughost
