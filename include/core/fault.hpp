#ifndef FAULT_HPP
#define FAULT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

enum class FaultKind {
    DeviceUnavailable,
    DeviceLost,
    RecorderSpawnFailed,
    RecorderExitedAbnormally,
    TranscriptionFailed,
    TranscriptionTimedOut,
    AcceleratorUnavailable,
    InjectorMissing,
    InjectorSocketMissing,
    InjectionFailed,
    ConfigInvalid,
    UserUnknown,
    Cancelled
};

// Startup faults end the process, device faults trigger re-resolution,
// session faults only cost the current gesture.
enum class FaultClass { Startup, Device, Session, Configuration };

const char* faultName(FaultKind kind);
FaultClass faultClass(FaultKind kind);

struct Fault {
    FaultKind kind;
    std::string detail;

    std::string describe() const;
};

class FaultError : public std::runtime_error {
public:
    explicit FaultError(Fault fault)
        : std::runtime_error(fault.describe()), fault_(std::move(fault)) {}

    const Fault& fault() const { return fault_; }

private:
    Fault fault_;
};

template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Fault fault) : state_(std::move(fault)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Fault& fault() const { return std::get<Fault>(state_); }

private:
    std::variant<T, Fault> state_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Fault fault) : fault_(std::move(fault)) {}

    bool ok() const { return !fault_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Fault& fault() const { return *fault_; }

private:
    std::optional<Fault> fault_;
};

#endif
