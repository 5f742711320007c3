//
// CommandBuilder.hpp
// LEDBLEEngine - Command Layer
//
// Renders a CommandTemplate plus named parameters into command bytes
//

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "CommandTemplate.hpp"
#include "../Common/ByteUtils.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::Capabilities {
class CapabilityDatabase;
}

namespace LEDBLE::Commands {

using CommandParams = std::map<std::string, int32_t, std::less<>>;

/// Pure template renderer. Never touches the network.
///
/// Rendering rules:
/// - `{name}` becomes the two hex digits of `params[name] & 0xFF`
/// - a placeholder repeated in one form renders the same byte at every
///   occurrence (no multi-byte expansion)
/// - a value outside its declared FieldRange fails with ParameterOutOfRange
/// - a placeholder with no parameter fails with MissingParameter
/// - when the template asks for it, Checksum() of all bytes is appended
class CommandBuilder {
public:
    /// Render with explicit field ranges (usually CapabilityDatabase::FieldsFor)
    [[nodiscard]] static Result<Bytes::Buffer> Build(const CommandTemplate& tpl,
                                                     const CommandParams& params,
                                                     std::span<const FieldRange> fields = {});

    /// Resolve the template for a product and render it with the product's field ranges
    [[nodiscard]] static Result<Bytes::Buffer> Build(const Capabilities::CapabilityDatabase& db,
                                                     uint16_t productId,
                                                     std::string_view functionCode,
                                                     const CommandParams& params);

private:
    static Result<std::string> Substitute(const CommandTemplate& tpl,
                                          const CommandParams& params,
                                          std::span<const FieldRange> fields);
};

} // namespace LEDBLE::Commands
