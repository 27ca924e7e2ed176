#include "domain/StockLocation.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <cctype>

namespace inventory::domain {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

Address normalize(const Address& address) {
    Address result = address;
    result.address1 = trim(address.address1);
    result.address2 = trim(address.address2);
    result.city = trim(address.city);
    result.zipcode = trim(address.zipcode);
    result.phone = trim(address.phone);
    result.company = trim(address.company);
    return result;
}

bool sameAddress(const Address& a, const Address& b) {
    return a.address1 == b.address1 && a.address2 == b.address2 && a.city == b.city &&
           a.zipcode == b.zipcode && a.phone == b.phone && a.company == b.company &&
           a.countryId == b.countryId && a.stateId == b.stateId;
}

} // namespace

Result<StockLocation> StockLocation::create(
    const std::string& name,
    const std::optional<std::string>& presentation,
    bool active,
    bool isDefault,
    const Address& address)
{
    const std::string trimmedName = trim(name);
    if (trimmedName.empty()) {
        return Error(ErrorCode::INVALID_NAME, "Stock location name is required.");
    }

    StockLocation location;
    location.id = utils::UuidGenerator::generate();
    location.name = trimmedName;
    location.presentation = presentation && !trim(*presentation).empty() ? trim(*presentation) : trimmedName;
    location.active = active;
    location.isDefault = isDefault;
    location.address = normalize(address);
    location.createdAt = Timestamp::now();
    location.updatedAt = location.createdAt;
    return location;
}

Result<bool> StockLocation::update(const StockLocationUpdate& changes) {
    bool changed = false;

    if (changes.name) {
        const std::string trimmedName = trim(*changes.name);
        if (trimmedName.empty()) {
            return Error(ErrorCode::INVALID_NAME, "Stock location name is required.");
        }
        if (trimmedName != name) {
            name = trimmedName;
            changed = true;
        }
    }
    if (changes.presentation) {
        const std::string value = trim(*changes.presentation).empty() ? name : trim(*changes.presentation);
        if (value != presentation) {
            presentation = value;
            changed = true;
        }
    }
    if (changes.active && *changes.active != active) {
        active = *changes.active;
        changed = true;
    }
    if (changes.address) {
        Address normalized = normalize(*changes.address);
        if (!sameAddress(normalized, address)) {
            address = normalized;
            changed = true;
        }
    }

    if (changed) {
        updatedAt = Timestamp::now();
    }
    return changed;
}

bool StockLocation::makeDefault() {
    if (isDefault) {
        return false;
    }
    isDefault = true;
    updatedAt = Timestamp::now();
    return true;
}

bool StockLocation::clearDefault() {
    if (!isDefault) {
        return false;
    }
    isDefault = false;
    updatedAt = Timestamp::now();
    return true;
}

Result<Success> StockLocation::checkDeletable(const std::vector<StockItem>& ownedItems) {
    for (const auto& item : ownedItems) {
        if (!item.isDeleted() && item.quantityReserved() > 0) {
            return Error(ErrorCode::HAS_RESERVED_STOCK,
                         "Cannot delete a stock location with reserved stock.");
        }
    }
    for (const auto& item : ownedItems) {
        if (!item.isDeleted() && item.quantityOnHand() > 0) {
            return Error(ErrorCode::HAS_STOCK_ITEMS,
                         "Cannot delete a stock location that still holds stock.");
        }
    }
    return Success{};
}

void StockLocation::markDeleted() {
    if (deletedAt) {
        return;
    }
    deletedAt = Timestamp::now();
    isDefault = false;
    updatedAt = *deletedAt;
}

bool StockLocation::restore() {
    if (!deletedAt) {
        return false;
    }
    deletedAt.reset();
    updatedAt = Timestamp::now();
    return true;
}

} // namespace inventory::domain
