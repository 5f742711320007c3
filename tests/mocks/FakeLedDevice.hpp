#pragma once

#include "../../LEDBLEEngine/Common/ByteUtils.hpp"
#include "../../LEDBLEEngine/Transport/IBleTransport.hpp"
#include "../../LEDBLEEngine/Transport/TransportCodec.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace LEDBLE::Transport::Fakes {

/**
 * @brief Simulated LED controller behind the BLE adapter interface.
 *
 * Unlike MockBleTransport (gmock expectations), FakeLedDevice keeps device
 * state and answers the way hardware does: writes are deframed and applied
 * (0x31 / 0x3B A1 colour, 0x71 / 0x3B power, 0x61 / 0x38 / 0x42 effects) and state
 * queries (0x81) are answered on the notify callback with a 14-byte state
 * response in the configured style.
 *
 * Channels the device lacks ignore writes, so an RGB-only device never shows
 * a warm or cool white value.
 *
 * **Example usage**:
 *
 *   FakeLedDevice device(FramingVersion::Legacy, {.rgb = true});
 *   device.SetOutput(10, 20, 30, 0, 0);
 *
 *   DeviceSession session(device, scheduler);
 *   session.Attach(FakeLedDevice::kHandle, FramingVersion::Legacy, 255);
 *   session.Submit(SessionRequest::Query(query, 0x81, 14), [](auto response) {
 *       EXPECT_TRUE(response.has_value());
 *   });
 */
class FakeLedDevice : public IBleTransport {
public:
    static constexpr ConnectionHandle kHandle = 7;

    struct Channels {
        bool rgb{true};
        bool warmWhite{false};
        bool coolWhite{false};
    };

    enum class ResponseStyle {
        Framed,  // wrapped in link frames, same sequence number as the request
        Raw,     // bare response bytes
        Json,    // {"code":0,"payload":"<hex>"}
    };

    explicit FakeLedDevice(FramingVersion framing = FramingVersion::Legacy)
        : FakeLedDevice(framing, Channels{}) {}

    FakeLedDevice(FramingVersion framing, Channels channels)
        : framing_(framing), channels_(channels) {}

    // =========================================================================
    // Programming API
    // =========================================================================

    void SetOutput(uint8_t r, uint8_t g, uint8_t b, uint8_t ww, uint8_t cw) {
        red_ = channels_.rgb ? r : 0;
        green_ = channels_.rgb ? g : 0;
        blue_ = channels_.rgb ? b : 0;
        warm_ = channels_.warmWhite ? ww : 0;
        cool_ = channels_.coolWhite ? cw : 0;
        effect_.reset();
    }

    /// Running effect as reported in a state response (speed byte as the device sends it)
    void SetEffect(uint8_t id, uint8_t speed, uint8_t brightnessPercent) {
        effect_ = Effect{id, speed, brightnessPercent};
    }

    void SetPower(bool on) { powerOn_ = on; }
    void SetGrantedMtu(uint16_t mtu) { grantedMtu_ = mtu; }
    void SetMtuNegotiationFails(bool fails) { mtuFails_ = fails; }
    void SetConnectFails(bool fails) { connectFails_ = fails; }
    void SetRespondToQueries(bool respond) { respondToQueries_ = respond; }
    void SetResponseStyle(ResponseStyle style) { style_ = style; }
    void SetResponseMtu(uint16_t mtu) { responseMtu_ = mtu; }

    /// Writes numbered from 1; the given write and every later one fail
    void FailWritesFrom(size_t writeNumber) { failFrom_ = writeNumber; }

    /// LED settings answer for 0x63 queries, sent as given
    void SetLedSettingsResponse(Bytes::Buffer response) { ledSettings_ = std::move(response); }

    /// Queue responses instead of sending them from inside Write()
    void HoldResponses(bool hold) { holdResponses_ = hold; }

    void ReleaseResponses() {
        while (!held_.empty()) {
            auto [bytes, sequence] = std::move(held_.front());
            held_.pop_front();
            Deliver(bytes, sequence);
        }
    }

    /// Device-initiated notification (physical remote, app on another phone)
    void PushNotification(std::span<const uint8_t> bytes) {
        if (notify_) {
            notify_(bytes);
        }
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Logical commands the device received, deframed
    [[nodiscard]] const std::vector<Bytes::Buffer>& Commands() const { return commands_; }
    [[nodiscard]] const std::vector<Bytes::Buffer>& RawWrites() const { return rawWrites_; }
    [[nodiscard]] bool IsDisconnected() const { return disconnected_; }
    [[nodiscard]] bool PowerOn() const { return powerOn_; }
    [[nodiscard]] uint8_t Red() const { return red_; }
    [[nodiscard]] uint8_t Blue() const { return blue_; }
    [[nodiscard]] bool RunningEffect() const { return effect_.has_value(); }
    [[nodiscard]] uint8_t WarmWhite() const { return warm_; }
    [[nodiscard]] uint8_t CoolWhite() const { return cool_; }
    [[nodiscard]] size_t HeldResponses() const { return held_.size(); }

    /// 14-byte 0x81 response for the current output
    [[nodiscard]] Bytes::Buffer StateResponse() const {
        Bytes::Buffer bytes(14, 0x00);
        bytes[0] = 0x81;
        bytes[1] = 0x01;
        bytes[2] = powerOn_ ? 0x23 : 0x24;
        if (effect_) {
            bytes[3] = 0x25;
            bytes[4] = effect_->id;
            bytes[6] = effect_->brightness;
            bytes[7] = effect_->speed;
        } else {
            bytes[3] = 0x61;
            bytes[4] = whiteMode_ ? 0x0F : 0xF0;
            bytes[6] = red_;
            bytes[7] = green_;
            bytes[8] = blue_;
            bytes[9] = warm_;
            bytes[11] = cool_;
        }
        bytes[10] = 0x0A;
        bytes[13] = Bytes::Checksum(std::span<const uint8_t>(bytes).first(13));
        return bytes;
    }

    // =========================================================================
    // IBleTransport
    // =========================================================================

    void Connect(std::string_view address, ConnectCompletion completion) override {
        address_ = std::string(address);
        if (connectFails_) {
            completion(LEDBLE_ERROR_RECOVERABLE(TransportError::Disconnected, "Device not reachable"));
            return;
        }
        disconnected_ = false;
        completion(kHandle);
    }

    void Write(ConnectionHandle handle,
               std::span<const uint8_t> bytes,
               WriteCompletion completion) override {
        rawWrites_.emplace_back(bytes.begin(), bytes.end());
        if (handle != kHandle || disconnected_ || (failFrom_ != 0 && rawWrites_.size() >= failFrom_)) {
            completion(LEDBLE_ERROR_RECOVERABLE(TransportError::WriteFailed, "GATT write rejected"));
            return;
        }

        std::optional<std::pair<Bytes::Buffer, uint8_t>> response;
        if (auto frame = TransportCodec::Deserialize(bytes, framing_)) {
            auto message = decoder_.DecodeIncoming(*frame);
            if (message && message->status != ReassemblyStatus::Pending) {
                commands_.push_back(message->bytes);
                if (auto answer = Apply(message->bytes)) {
                    response.emplace(std::move(*answer), message->sequence);
                }
            }
        }

        completion(Result<void>{});

        if (response) {
            if (holdResponses_) {
                held_.push_back(std::move(*response));
            } else {
                Deliver(response->first, response->second);
            }
        }
    }

    void Subscribe(ConnectionHandle, NotificationCallback callback) override {
        notify_ = std::move(callback);
    }

    void Disconnect(ConnectionHandle) override {
        disconnected_ = true;
    }

    void NegotiateMtu(ConnectionHandle, uint16_t requested, MtuCompletion completion) override {
        if (mtuFails_) {
            completion(LEDBLE_ERROR_RECOVERABLE(TransportError::WriteFailed, "MTU exchange rejected"));
            return;
        }
        completion(std::min(requested, grantedMtu_));
    }

    [[nodiscard]] const std::string& Address() const { return address_; }

private:
    struct Effect {
        uint8_t id{0};
        uint8_t speed{0};
        uint8_t brightness{0};
    };

    std::optional<Bytes::Buffer> Apply(const Bytes::Buffer& command) {
        if (command.empty()) {
            return std::nullopt;
        }

        switch (command[0]) {
            case 0x31:
                if (command.size() >= 9) {
                    const uint8_t mode = command[6];
                    if ((mode == 0xF0 || mode == 0x5A) && channels_.rgb) {
                        red_ = command[1];
                        green_ = command[2];
                        blue_ = command[3];
                    }
                    if (mode == 0x0F || mode == 0x5A) {
                        if (channels_.warmWhite) warm_ = command[4];
                        if (channels_.coolWhite) cool_ = command[5];
                    }
                    whiteMode_ = mode == 0x0F;
                    effect_.reset();
                }
                return std::nullopt;

            case 0x3B:
                if (command.size() >= 12 && command[1] == 0xA1) {
                    if (channels_.rgb) {
                        red_ = command[7];
                        green_ = command[8];
                        blue_ = command[9];
                    }
                    whiteMode_ = false;
                    effect_.reset();
                    return std::nullopt;
                }
                [[fallthrough]];
            case 0x71:
                if (command.size() >= 2 && (command[1] == 0x23 || command[1] == 0x24)) {
                    powerOn_ = command[1] == 0x23;
                }
                return std::nullopt;

            case 0x61:
            case 0x38:
            case 0x42:
                if (command.size() >= 4) {
                    effect_ = Effect{command[1], command[2], command[0] == 0x61 ? uint8_t{100} : command[3]};
                }
                return std::nullopt;

            case 0x81:
                if (!respondToQueries_) {
                    return std::nullopt;
                }
                return StateResponse();

            case 0x63:
                if (!respondToQueries_ || ledSettings_.empty()) {
                    return std::nullopt;
                }
                return ledSettings_;

            default:
                return std::nullopt;
        }
    }

    void Deliver(const Bytes::Buffer& response, uint8_t sequence) {
        if (!notify_) {
            return;
        }

        switch (style_) {
            case ResponseStyle::Raw:
                notify_(response);
                return;

            case ResponseStyle::Json: {
                std::string hex;
                for (uint8_t b : response) {
                    static constexpr char kDigits[] = "0123456789ABCDEF";
                    hex.push_back(kDigits[b >> 4]);
                    hex.push_back(kDigits[b & 0x0F]);
                }
                const std::string text = "{\"code\":0,\"payload\":\"" + hex + "\"}";
                notify_(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
                return;
            }

            case ResponseStyle::Framed: {
                EncodeOptions options{};
                options.commandId = kCmdFireAndForget;
                options.framing = framing_;
                options.mtu = responseMtu_;
                options.sequence = sequence;
                auto frames = TransportCodec::Encode(response, options);
                if (!frames) {
                    return;
                }
                for (const auto& frame : *frames) {
                    const auto wire = TransportCodec::Serialize(frame);
                    notify_(wire);
                }
                return;
            }
        }
    }

    FramingVersion framing_;
    Channels channels_;
    TransportDecoder decoder_;
    NotificationCallback notify_;

    std::string address_;
    bool disconnected_{false};
    bool connectFails_{false};
    bool mtuFails_{false};
    bool respondToQueries_{true};
    bool holdResponses_{false};
    uint16_t grantedMtu_{255};
    uint16_t responseMtu_{512};
    size_t failFrom_{0};
    ResponseStyle style_{ResponseStyle::Framed};

    bool powerOn_{true};
    bool whiteMode_{false};
    uint8_t red_{0};
    uint8_t green_{0};
    uint8_t blue_{0};
    uint8_t warm_{0};
    uint8_t cool_{0};
    std::optional<Effect> effect_;
    Bytes::Buffer ledSettings_;

    std::vector<Bytes::Buffer> commands_;
    std::vector<Bytes::Buffer> rawWrites_;
    std::deque<std::pair<Bytes::Buffer, uint8_t>> held_;
};

} // namespace LEDBLE::Transport::Fakes
