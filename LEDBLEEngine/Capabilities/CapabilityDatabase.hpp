// SPDX-License-Identifier: LGPL-3.0-or-later
// Copyright (c) 2024 LEDBLE Project
//
// CapabilityDatabase.hpp - Static product table and command template lookup

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "CapabilityTypes.hpp"
#include "../Commands/CommandTemplate.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::Capabilities {

/// Read-only product capability table.
///
/// Built once from static data; every accessor is const and no API mutates
/// it. Per-product behavior is data (declared functions, firmware gates,
/// template overrides), never a subclass.
class CapabilityDatabase {
public:
    static constexpr uint16_t kRingLight0x53 = 0x53;
    static constexpr uint16_t kCtrlMiniRgb = 0x33;
    static constexpr uint16_t kFillLight = 29;

    /// Built-in table shared by the whole process
    [[nodiscard]] static const CapabilityDatabase& Shared();

    /// Custom table (tests, host-supplied extensions). Spans must outlive the database.
    CapabilityDatabase(std::span<const CapabilityRecord> records,
                       std::span<const Commands::CommandTemplate> defaults) noexcept
        : records_(records), defaults_(defaults) {}

    CapabilityDatabase(const CapabilityDatabase&) = delete;
    CapabilityDatabase& operator=(const CapabilityDatabase&) = delete;

    /// Record for a product id, or CapabilityError::UnknownProduct
    [[nodiscard]] Result<const CapabilityRecord*> Lookup(uint16_t productId) const;

    /// True only if the function is declared for the product and
    /// firmwareVersion >= its declared minimum
    [[nodiscard]] bool Supports(uint16_t productId,
                                std::string_view functionCode,
                                uint16_t firmwareVersion) const;

    /// Product override if present, else global default, else TemplateError::UnknownFunction
    [[nodiscard]] Result<Commands::CommandTemplate> ResolveTemplate(uint16_t productId,
                                                                    std::string_view functionCode) const;

    /// Declared field ranges for a function (empty when undeclared)
    [[nodiscard]] std::span<const Commands::FieldRange> FieldsFor(uint16_t productId,
                                                                  std::string_view functionCode) const;

    /// First supported function from a preference list
    [[nodiscard]] std::optional<std::string_view> BestFunction(
        uint16_t productId,
        uint16_t firmwareVersion,
        std::span<const std::string_view> preferences) const;

    /// Channel/effect set declared for a product. UnknownProduct when the id is
    /// absent or the record defers to probing.
    [[nodiscard]] Result<DeviceCapabilities> DeclaredCapabilities(uint16_t productId) const;

    [[nodiscard]] const Commands::CommandTemplate* DefaultTemplate(std::string_view functionCode) const;

    [[nodiscard]] std::span<const CapabilityRecord> Records() const { return records_; }

private:
    const CapabilityRecord* Find(uint16_t productId) const;

    std::span<const CapabilityRecord> records_;
    std::span<const Commands::CommandTemplate> defaults_;
};

} // namespace LEDBLE::Capabilities
