#include "domain/StockTransfer.hpp"
#include "utils/UuidGenerator.hpp"

namespace inventory::domain {

Result<StockTransfer> StockTransfer::create(
    const std::string& number,
    const std::optional<std::string>& sourceLocationId,
    const std::optional<std::string>& destinationLocationId,
    const std::optional<std::string>& reference)
{
    if (!sourceLocationId && !destinationLocationId) {
        return Error(ErrorCode::MISSING_LOCATION,
                     "A stock transfer needs a source or a destination location.");
    }
    if (sourceLocationId && destinationLocationId && *sourceLocationId == *destinationLocationId) {
        return Error(ErrorCode::SOURCE_EQUALS_DESTINATION,
                     "Source and destination locations must differ.");
    }

    StockTransfer transfer;
    transfer.id = utils::UuidGenerator::generate();
    transfer.number = number;
    transfer.sourceLocationId = sourceLocationId;
    transfer.destinationLocationId = destinationLocationId;
    transfer.reference = reference;
    transfer.createdAt = Timestamp::now();
    return transfer;
}

Result<Success> StockTransfer::validateLines(const VariantQuantities& lines) {
    if (lines.empty()) {
        return Error(ErrorCode::NO_VARIANTS, "A stock transfer needs at least one variant.");
    }
    for (const auto& [variantId, quantity] : lines) {
        if (quantity <= 0) {
            return Error::invalidQuantity("Quantity for variant '" + variantId + "' must be positive.");
        }
    }
    return Success{};
}

} // namespace inventory::domain
