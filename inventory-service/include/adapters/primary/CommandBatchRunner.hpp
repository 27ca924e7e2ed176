#pragma once

#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IInventoryUnitService.hpp"
#include "ports/input/IStockItemService.hpp"
#include "ports/input/IStockLocationService.hpp"
#include "ports/input/IStockTransferService.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace inventory::adapters::primary {

/**
 * @brief Выполняет пакет JSON-команд через входные порты
 *
 * Формат пакета: массив команд либо объект {"commands": [...]}.
 * Команда: {"op": "stock_item.reserve", "id": "...", "quantity": 2, ...}.
 *
 * Команда с полем "as" сохраняет id своего результата под этим именем;
 * строка "$name" в следующих командах заменяется сохранённым id.
 *
 * Результат на каждую команду:
 * - {"op": ..., "ok": true, "result": ...}
 * - {"op": ..., "ok": false, "error": {"code", "kind", "message"}}
 *
 * Некорректная команда даёт ошибку BAD_REQUEST и не прерывает пакет.
 * Инфраструктурные исключения пробрасываются наружу.
 */
class CommandBatchRunner {
public:
    CommandBatchRunner(
        std::shared_ptr<ports::input::IStockItemService> stockItems,
        std::shared_ptr<ports::input::IStockTransferService> transfers,
        std::shared_ptr<ports::input::IInventoryUnitService> units,
        std::shared_ptr<ports::input::IStockLocationService> locations
    ) : stockItems_(std::move(stockItems))
      , transfers_(std::move(transfers))
      , units_(std::move(units))
      , locations_(std::move(locations))
    {
        registerStockLocationCommands();
        registerStockItemCommands();
        registerTransferCommands();
        registerUnitCommands();
        std::cout << "[CommandBatchRunner] Created with " << commands_.size() << " commands" << std::endl;
    }

    /// Массив команд пакета
    static const nlohmann::json& commandsOf(const nlohmann::json& batch) {
        const nlohmann::json& commands = batch.is_object() ? batch.at("commands") : batch;
        if (!commands.is_array()) {
            throw std::invalid_argument("Command batch must be an array");
        }
        return commands;
    }

    nlohmann::json run(const nlohmann::json& batch) {
        const auto& commands = commandsOf(batch);

        nlohmann::json results = nlohmann::json::array();
        for (const auto& command : commands) {
            results.push_back(runOne(command));
        }
        return results;
    }

    nlohmann::json runOne(const nlohmann::json& rawCommand) {
        nlohmann::json response;
        response["op"] = rawCommand.is_object() ? rawCommand.value("op", "") : "";

        try {
            auto command = substitute(rawCommand);
            std::string op = command.at("op").get<std::string>();

            auto it = commands_.find(op);
            if (it == commands_.end()) {
                return badRequest(response, "Unknown command: " + op);
            }

            auto outcome = it->second(command);
            if (outcome.isError()) {
                std::cout << "[CommandBatchRunner] " << op << " failed: " << outcome.error() << std::endl;
                response["ok"] = false;
                response["error"] = toJson(outcome.error());
                return response;
            }

            response["ok"] = true;
            response["result"] = outcome.value();
            remember(command, outcome.value());
            return response;

        } catch (const nlohmann::json::exception& e) {
            return badRequest(response, e.what());
        } catch (const std::invalid_argument& e) {
            return badRequest(response, e.what());
        }
    }

private:
    using Outcome = domain::Result<nlohmann::json>;
    using Command = std::function<Outcome(const nlohmann::json&)>;

    std::shared_ptr<ports::input::IStockItemService> stockItems_;
    std::shared_ptr<ports::input::IStockTransferService> transfers_;
    std::shared_ptr<ports::input::IInventoryUnitService> units_;
    std::shared_ptr<ports::input::IStockLocationService> locations_;

    std::map<std::string, Command> commands_;
    std::map<std::string, std::string> aliases_;

    template <typename T>
    static Outcome present(const domain::Result<T>& result) {
        if (result.isError()) {
            return result.error();
        }
        return nlohmann::json(toJson(result.value()));
    }

    static Outcome present(const domain::Result<domain::Success>& result) {
        if (result.isError()) {
            return result.error();
        }
        return nlohmann::json::object();
    }

    static nlohmann::json badRequest(nlohmann::json& response, const std::string& message) {
        std::cerr << "[CommandBatchRunner] Bad request: " << message << std::endl;
        response["ok"] = false;
        response["error"] = {{"code", "BAD_REQUEST"}, {"kind", "VALIDATION"}, {"message", message}};
        return response;
    }

    static std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
        return j.at(key).get<std::string>();
    }

    static domain::MovementOriginator originatorOf(const nlohmann::json& j) {
        return domain::parseMovementOriginator(j.value("originator", "ADJUSTMENT"));
    }

    nlohmann::json substitute(const nlohmann::json& value) const {
        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            if (text.size() > 1 && text[0] == '$') {
                auto alias = aliases_.find(text.substr(1));
                if (alias == aliases_.end()) {
                    throw std::invalid_argument("Unknown reference: " + text);
                }
                return alias->second;
            }
            return value;
        }
        if (value.is_object() || value.is_array()) {
            nlohmann::json copy = value;
            for (auto it = copy.begin(); it != copy.end(); ++it) {
                *it = substitute(*it);
            }
            return copy;
        }
        return value;
    }

    void remember(const nlohmann::json& command, const nlohmann::json& result) {
        if (!command.contains("as")) return;
        if (result.is_object() && result.contains("id")) {
            aliases_[command.at("as").get<std::string>()] = result.at("id").get<std::string>();
        } else if (result.is_object() && result.contains("extracted")) {
            aliases_[command.at("as").get<std::string>()] = result.at("extracted").at("id").get<std::string>();
        }
    }

    // ========================================================================
    // stock_location.*
    // ========================================================================

    void registerStockLocationCommands() {
        commands_["stock_location.create"] = [this](const nlohmann::json& c) {
            ports::input::CreateStockLocationRequest request;
            request.name = c.at("name").get<std::string>();
            request.presentation = optionalString(c, "presentation");
            request.active = c.value("active", true);
            request.isDefault = c.value("isDefault", false);
            if (c.contains("address")) {
                request.address = addressFromJson(c.at("address"));
            }
            return present(locations_->createLocation(request));
        };

        commands_["stock_location.update"] = [this](const nlohmann::json& c) {
            domain::StockLocationUpdate changes;
            changes.name = optionalString(c, "name");
            changes.presentation = optionalString(c, "presentation");
            if (c.contains("active")) {
                changes.active = c.at("active").get<bool>();
            }
            if (c.contains("address")) {
                changes.address = addressFromJson(c.at("address"));
            }
            return present(locations_->updateLocation(c.at("id").get<std::string>(), changes));
        };

        commands_["stock_location.make_default"] = [this](const nlohmann::json& c) {
            return present(locations_->makeDefault(c.at("id").get<std::string>()));
        };

        commands_["stock_location.delete"] = [this](const nlohmann::json& c) {
            return present(locations_->deleteLocation(c.at("id").get<std::string>()));
        };

        commands_["stock_location.restore"] = [this](const nlohmann::json& c) {
            return present(locations_->restoreLocation(c.at("id").get<std::string>()));
        };

        commands_["stock_location.restock"] = [this](const nlohmann::json& c) {
            return present(locations_->restock(levelChange(c)));
        };

        commands_["stock_location.unstock"] = [this](const nlohmann::json& c) {
            return present(locations_->unstock(levelChange(c)));
        };

        commands_["stock_location.get"] = [this](const nlohmann::json& c) {
            return present(locations_->getLocation(c.at("id").get<std::string>()));
        };

        commands_["stock_location.list"] = [this](const nlohmann::json&) {
            return Outcome(toJson(locations_->getLocations()));
        };

        commands_["stock_location.default"] = [this](const nlohmann::json&) {
            return present(locations_->getDefaultLocation());
        };

        commands_["stock_location.items"] = [this](const nlohmann::json& c) {
            return present(locations_->getStockItems(c.at("id").get<std::string>()));
        };
    }

    static ports::input::StockLevelChangeRequest levelChange(const nlohmann::json& c) {
        ports::input::StockLevelChangeRequest request;
        request.stockLocationId = c.at("id").get<std::string>();
        request.variants = variantsFromJson(c.at("variants"));
        request.originator = originatorOf(c);
        request.reason = optionalString(c, "reason");
        return request;
    }

    // ========================================================================
    // stock_item.*
    // ========================================================================

    void registerStockItemCommands() {
        commands_["stock_item.create"] = [this](const nlohmann::json& c) {
            ports::input::CreateStockItemRequest request;
            request.variantId = c.at("variantId").get<std::string>();
            request.stockLocationId = c.at("stockLocationId").get<std::string>();
            request.sku = c.value("sku", "");
            request.quantityOnHand = c.value("quantityOnHand", int64_t{0});
            request.quantityReserved = c.value("quantityReserved", int64_t{0});
            request.backorderable = c.value("backorderable", true);
            return present(stockItems_->createStockItem(request));
        };

        commands_["stock_item.adjust"] = [this](const nlohmann::json& c) {
            ports::input::AdjustStockRequest request;
            request.stockItemId = c.at("id").get<std::string>();
            request.quantity = c.at("quantity").get<int64_t>();
            request.originator = originatorOf(c);
            request.reason = optionalString(c, "reason");
            return present(stockItems_->adjust(request));
        };

        commands_["stock_item.reserve"] = [this](const nlohmann::json& c) {
            return present(stockItems_->reserve(
                c.at("id").get<std::string>(), c.at("quantity").get<int64_t>(), optionalString(c, "orderId")));
        };

        commands_["stock_item.release"] = [this](const nlohmann::json& c) {
            return present(stockItems_->release(
                c.at("id").get<std::string>(), c.at("quantity").get<int64_t>(),
                c.at("orderId").get<std::string>()));
        };

        commands_["stock_item.confirm_shipment"] = [this](const nlohmann::json& c) {
            return present(stockItems_->confirmShipment(
                c.at("id").get<std::string>(), c.at("quantity").get<int64_t>(),
                c.at("shipmentId").get<std::string>()));
        };

        commands_["stock_item.correct_reserved"] = [this](const nlohmann::json& c) {
            return present(stockItems_->correctReserved(
                c.at("id").get<std::string>(), c.at("quantityReserved").get<int64_t>(),
                optionalString(c, "reason")));
        };

        commands_["stock_item.update"] = [this](const nlohmann::json& c) {
            return present(stockItems_->updateDetails(
                c.at("id").get<std::string>(), c.at("sku").get<std::string>(),
                c.at("backorderable").get<bool>()));
        };

        commands_["stock_item.delete"] = [this](const nlohmann::json& c) {
            return present(stockItems_->deleteStockItem(c.at("id").get<std::string>()));
        };

        commands_["stock_item.get"] = [this](const nlohmann::json& c) {
            return present(stockItems_->getStockItem(c.at("id").get<std::string>()));
        };

        commands_["stock_item.find"] = [this](const nlohmann::json& c) {
            return present(stockItems_->findStockItem(
                c.at("variantId").get<std::string>(), c.at("stockLocationId").get<std::string>()));
        };

        commands_["stock_item.movements"] = [this](const nlohmann::json& c) {
            return present(stockItems_->getMovements(c.at("id").get<std::string>()));
        };
    }

    // ========================================================================
    // stock_transfer.*
    // ========================================================================

    void registerTransferCommands() {
        commands_["stock_transfer.transfer"] = [this](const nlohmann::json& c) {
            ports::input::TransferRequest request;
            request.sourceLocationId = c.at("sourceLocationId").get<std::string>();
            request.destinationLocationId = c.at("destinationLocationId").get<std::string>();
            request.variants = variantsFromJson(c.at("variants"));
            request.reference = optionalString(c, "reference");
            return present(transfers_->transfer(request));
        };

        commands_["stock_transfer.receive"] = [this](const nlohmann::json& c) {
            ports::input::ReceiveRequest request;
            request.destinationLocationId = c.at("destinationLocationId").get<std::string>();
            request.variants = variantsFromJson(c.at("variants"));
            request.reference = optionalString(c, "reference");
            return present(transfers_->receive(request));
        };

        commands_["stock_transfer.get"] = [this](const nlohmann::json& c) {
            return present(transfers_->getTransfer(c.at("id").get<std::string>()));
        };

        commands_["stock_transfer.movements"] = [this](const nlohmann::json& c) {
            return present(transfers_->getTransferMovements(c.at("id").get<std::string>()));
        };
    }

    // ========================================================================
    // inventory_unit.*
    // ========================================================================

    void registerUnitCommands() {
        commands_["inventory_unit.create"] = [this](const nlohmann::json& c) {
            ports::input::CreateInventoryUnitRequest request;
            request.variantId = c.at("variantId").get<std::string>();
            request.orderId = c.at("orderId").get<std::string>();
            request.lineItemId = c.at("lineItemId").get<std::string>();
            request.quantity = c.value("quantity", int64_t{1});
            request.initialState = domain::parseInventoryUnitState(c.value("state", "ON_HAND"));
            request.stockLocationId = optionalString(c, "stockLocationId");
            request.shipmentId = optionalString(c, "shipmentId");
            request.serialNumber = optionalString(c, "serialNumber");
            return present(units_->createUnit(request));
        };

        commands_["inventory_unit.fill_backorder"] = [this](const nlohmann::json& c) {
            return present(units_->fillBackorder(c.at("id").get<std::string>()));
        };

        commands_["inventory_unit.ship"] = [this](const nlohmann::json& c) {
            return present(units_->ship(c.at("id").get<std::string>(), optionalString(c, "shipmentId")));
        };

        commands_["inventory_unit.return"] = [this](const nlohmann::json& c) {
            return present(units_->returnUnit(c.at("id").get<std::string>(), optionalString(c, "returnItemId")));
        };

        commands_["inventory_unit.cancel"] = [this](const nlohmann::json& c) {
            return present(units_->cancel(c.at("id").get<std::string>()));
        };

        commands_["inventory_unit.split"] = [this](const nlohmann::json& c) {
            auto result = units_->split(c.at("id").get<std::string>(), c.at("quantity").get<int64_t>());
            if (result.isError()) {
                return Outcome(result.error());
            }
            nlohmann::json j;
            j["original"] = toJson(result.value().original);
            j["extracted"] = toJson(result.value().extracted);
            return Outcome(j);
        };

        commands_["inventory_unit.set_location"] = [this](const nlohmann::json& c) {
            return present(units_->setStockLocation(
                c.at("id").get<std::string>(), c.at("stockLocationId").get<std::string>()));
        };

        commands_["inventory_unit.get"] = [this](const nlohmann::json& c) {
            return present(units_->getUnit(c.at("id").get<std::string>()));
        };

        commands_["inventory_unit.by_order"] = [this](const nlohmann::json& c) {
            return Outcome(toJson(units_->getUnitsByOrder(c.at("orderId").get<std::string>())));
        };

        commands_["inventory_unit.backordered"] = [this](const nlohmann::json& c) {
            return Outcome(toJson(units_->getBackorderedUnits(
                c.at("variantId").get<std::string>(), c.at("stockLocationId").get<std::string>())));
        };
    }
};

} // namespace inventory::adapters::primary
