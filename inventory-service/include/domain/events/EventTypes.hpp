#pragma once

namespace inventory::domain::events {

// Складские позиции
constexpr const char* STOCK_ITEM_CREATED = "stock_item.created";
constexpr const char* STOCK_ITEM_DELETED = "stock_item.deleted";
constexpr const char* STOCK_ADJUSTED = "stock.adjusted";
constexpr const char* STOCK_RESERVED = "stock.reserved";
constexpr const char* STOCK_RELEASED = "stock.released";
constexpr const char* STOCK_SHIPPED = "stock.shipped";
constexpr const char* STOCK_RESERVATION_CORRECTED = "stock.reservation_corrected";

// Перемещения
constexpr const char* STOCK_TRANSFERRED = "stock_transfer.transferred";
constexpr const char* STOCK_RECEIVED = "stock_transfer.received";

// Единицы товара
constexpr const char* UNIT_CREATED = "inventory_unit.created";
constexpr const char* UNIT_BACKORDER_FILLED = "inventory_unit.backorder_filled";
constexpr const char* UNIT_SHIPPED = "inventory_unit.shipped";
constexpr const char* UNIT_RETURNED = "inventory_unit.returned";
constexpr const char* UNIT_CANCELED = "inventory_unit.canceled";
constexpr const char* UNIT_SPLIT = "inventory_unit.split";
constexpr const char* UNIT_LOCATION_ASSIGNED = "inventory_unit.location_assigned";

// Склады
constexpr const char* LOCATION_CREATED = "stock_location.created";
constexpr const char* LOCATION_UPDATED = "stock_location.updated";
constexpr const char* LOCATION_DELETED = "stock_location.deleted";
constexpr const char* LOCATION_RESTORED = "stock_location.restored";
constexpr const char* LOCATION_MADE_DEFAULT = "stock_location.made_default";

} // namespace inventory::domain::events
