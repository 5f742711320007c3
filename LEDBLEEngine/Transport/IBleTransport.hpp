#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string_view>

#include "../Core/Error.hpp"

namespace LEDBLE::Transport {

// GATT layout exposed by the controllers (16-bit UUIDs on the Bluetooth base)
namespace Gatt {
inline constexpr uint16_t kServiceUuid = 0xFFFF;
inline constexpr uint16_t kWriteCharacteristicUuid = 0xFF01;
inline constexpr uint16_t kNotifyCharacteristicUuid = 0xFF02;
// Firmware update service; never used for control
inline constexpr uint16_t kOtaServiceUuid = 0xFE00;
inline constexpr uint16_t kOtaCharacteristicUuid = 0xFE01;
} // namespace Gatt

using ConnectionHandle = uint32_t;
inline constexpr ConnectionHandle kInvalidConnection = 0;

using ConnectCompletion = std::function<void(Result<ConnectionHandle>)>;
using WriteCompletion = std::function<void(Result<void>)>;
using MtuCompletion = std::function<void(Result<uint16_t>)>;
using NotificationCallback = std::function<void(std::span<const uint8_t>)>;

/**
 * @brief BLE adapter supplied by the host.
 *
 * Every call returns immediately; the completion runs when the adapter is
 * done (possibly synchronously, possibly on another thread). The engine never
 * scans, discovers services, or retries.
 *
 * Write failures are reported as TransportError::WriteFailed, lost links as
 * TransportError::Disconnected.
 */
class IBleTransport {
public:
    virtual ~IBleTransport() = default;

    virtual void Connect(std::string_view address, ConnectCompletion completion) = 0;

    /// Write to the control characteristic (0xFF01)
    virtual void Write(ConnectionHandle handle,
                       std::span<const uint8_t> bytes,
                       WriteCompletion completion) = 0;

    /// Register for the notify characteristic (0xFF02)
    virtual void Subscribe(ConnectionHandle handle, NotificationCallback callback) = 0;

    virtual void Disconnect(ConnectionHandle handle) = 0;

    /// Granted MTU (the payload size of a single write)
    virtual void NegotiateMtu(ConnectionHandle handle,
                              uint16_t requested,
                              MtuCompletion completion) = 0;
};

} // namespace LEDBLE::Transport
