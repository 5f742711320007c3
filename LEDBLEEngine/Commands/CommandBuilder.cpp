//
// CommandBuilder.cpp
// LEDBLEEngine - Command Layer
//

#include "CommandBuilder.hpp"

#include "../Capabilities/CapabilityDatabase.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::Commands {

namespace {
constexpr char kHexDigits[] = "0123456789ABCDEF";

const FieldRange* FindField(std::span<const FieldRange> fields, std::string_view name) {
    for (const auto& field : fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}
} // namespace

Result<std::string> CommandBuilder::Substitute(const CommandTemplate& tpl,
                                               const CommandParams& params,
                                               std::span<const FieldRange> fields) {
    const std::string_view form = tpl.form;
    std::string hex;
    hex.reserve(form.size());

    size_t pos = 0;
    while (pos < form.size()) {
        const char c = form[pos];
        if (c == '}') {
            return LEDBLE_ERROR_FATAL(TemplateError::MalformedTemplate, "Unbalanced '}' in template");
        }
        if (c != '{') {
            hex.push_back(c);
            ++pos;
            continue;
        }

        const size_t close = form.find('}', pos + 1);
        if (close == std::string_view::npos) {
            return LEDBLE_ERROR_FATAL(TemplateError::MalformedTemplate, "Unterminated placeholder in template");
        }
        const std::string_view name = form.substr(pos + 1, close - pos - 1);

        const auto it = params.find(name);
        if (it == params.end()) {
            LEDBLE_LOG_V1(Commands, "%.*s: missing parameter '%.*s'",
                          static_cast<int>(tpl.functionCode.size()), tpl.functionCode.data(),
                          static_cast<int>(name.size()), name.data());
            return LEDBLE_ERROR_FATAL(TemplateError::MissingParameter, "Template placeholder has no parameter");
        }

        const int32_t value = it->second;
        if (const auto* range = FindField(fields, name); range && !range->Accepts(value)) {
            LEDBLE_LOG_V1(Commands, "%.*s: %.*s=%d outside [%d, %d] step %d",
                          static_cast<int>(tpl.functionCode.size()), tpl.functionCode.data(),
                          static_cast<int>(name.size()), name.data(),
                          value, range->min, range->max, range->step);
            return LEDBLE_ERROR_FATAL(TemplateError::ParameterOutOfRange, "Parameter outside declared range");
        }

        const auto byte = static_cast<uint8_t>(value & 0xFF);
        hex.push_back(kHexDigits[byte >> 4]);
        hex.push_back(kHexDigits[byte & 0x0F]);
        pos = close + 1;
    }
    return hex;
}

Result<Bytes::Buffer> CommandBuilder::Build(const CommandTemplate& tpl,
                                            const CommandParams& params,
                                            std::span<const FieldRange> fields) {
    const std::string hex = LEDBLE_TRY(Substitute(tpl, params, fields));

    Bytes::Buffer bytes;
    if (!Bytes::FromHex(hex, bytes) || bytes.empty()) {
        LEDBLE_LOG_V1(Commands, "%.*s: rendered text is not hex: %s",
                      static_cast<int>(tpl.functionCode.size()), tpl.functionCode.data(), hex.c_str());
        return LEDBLE_ERROR_FATAL(TemplateError::MalformedTemplate, "Rendered template is not valid hex");
    }

    if (tpl.needsChecksum) {
        bytes.push_back(Bytes::Checksum(bytes));
    }

    LEDBLE_LOG_HEX(Commands, "%.*s -> %s",
                   static_cast<int>(tpl.functionCode.size()), tpl.functionCode.data(),
                   Bytes::ToHex(bytes).c_str());
    return bytes;
}

Result<Bytes::Buffer> CommandBuilder::Build(const Capabilities::CapabilityDatabase& db,
                                            uint16_t productId,
                                            std::string_view functionCode,
                                            const CommandParams& params) {
    const auto tpl = LEDBLE_TRY(db.ResolveTemplate(productId, functionCode));
    return Build(tpl, params, db.FieldsFor(productId, functionCode));
}

} // namespace LEDBLE::Commands
