#pragma once

#include "ports/output/IUniverseStore.hpp"
#include "settings/DbSettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace trader::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища вселенных
 *
 * Таблица: universes
 * - name VARCHAR(64) PRIMARY KEY
 * - instruments JSONB NOT NULL (массив Instrument)
 * - updated_at TIMESTAMP NOT NULL
 *
 * update() заменяет вселенную целиком.
 */
class PostgresUniverseStore : public ports::output::IUniverseStore {
public:
    explicit PostgresUniverseStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::vector<domain::Universe> getAll() override {
        std::vector<domain::Universe> universes;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec("SELECT name, instruments FROM universes ORDER BY name");

            for (const auto& row : result) {
                universes.push_back(toUniverse(row));
            }

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUniverseStore] getAll error: " << e.what() << std::endl;
            throw;
        }

        return universes;
    }

    std::optional<domain::Universe> get(const std::string& name) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT name, instruments FROM universes WHERE name = $1",
                name
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return toUniverse(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUniverseStore] get error: " << e.what() << std::endl;
            throw;
        }
    }

    void update(const domain::Universe& universe) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            nlohmann::json instruments = universe.instruments();

            txn.exec_params(
                "INSERT INTO universes (name, instruments, updated_at) "
                "VALUES ($1, $2::jsonb, NOW()) "
                "ON CONFLICT (name) DO UPDATE SET "
                "instruments = EXCLUDED.instruments, "
                "updated_at = EXCLUDED.updated_at",
                universe.name(),
                instruments.dump()
            );

            txn.commit();
            std::cout << "[PostgresUniverseStore] Saved universe '" << universe.name() << "' ("
                      << universe.size() << " instruments)" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUniverseStore] update error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::Universe toUniverse(const pqxx::row& row) {
        auto instruments = nlohmann::json::parse(row["instruments"].as<std::string>());
        return domain::Universe(
            row["name"].as<std::string>(),
            instruments.get<std::vector<domain::Instrument>>());
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS universes (
                    name VARCHAR(64) PRIMARY KEY,
                    instruments JSONB NOT NULL DEFAULT '[]'::jsonb,
                    updated_at TIMESTAMP NOT NULL DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresUniverseStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUniverseStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace trader::adapters::secondary
