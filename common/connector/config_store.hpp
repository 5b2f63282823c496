#pragma once

#include <types/enums.hpp>

#include <array>
#include <optional>
#include <string>

namespace g1 {

// Saved pairing record for one unit
struct UnitRecord {
    std::optional<std::string> address;
    std::optional<std::string> name;
    bool paired = false;

    bool has_address() const { return address.has_value() && !address->empty(); }
};

// Durable pairing configuration. Subclasses provide save().
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    UnitRecord& unit(Side side) { return units_[static_cast<size_t>(side)]; }
    const UnitRecord& unit(Side side) const { return units_[static_cast<size_t>(side)]; }

    // Typed field access
    const std::optional<std::string>& address(Side side) const { return unit(side).address; }
    const std::optional<std::string>& name(Side side) const { return unit(side).name; }
    bool paired(Side side) const { return unit(side).paired; }

    void set_address(Side side, std::optional<std::string> address) { unit(side).address = std::move(address); }
    void set_name(Side side, std::optional<std::string> name) { unit(side).name = std::move(name); }
    void set_paired(Side side, bool paired) { unit(side).paired = paired; }

    // Both addresses saved
    bool complete() const { return unit(Side::Left).has_address() && unit(Side::Right).has_address(); }

    // Reset both records in memory (not persisted until save())
    void clear() { units_ = {}; }

    // Persist atomically; returns false if the write failed
    virtual bool save() = 0;

private:
    std::array<UnitRecord, 2> units_{};
};

} // namespace g1
