#include "pg_pool_source.hpp"
#include "codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <random>
#include <cmath>

PgPoolSource::PgPoolSource(const Config& config)
    : config_(config) {
}

PgPoolSource::~PgPoolSource() = default;

template<typename Func>
auto PgPoolSource::execute_with_retry(Func query_func, const std::string& operation_name, int max_retries)
    -> decltype(query_func()) {
    int attempts = 0;
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_real_distribution<> jitter(0.1, 0.3);

    while (true) {
        try {
            return query_func();
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("Database connection error during {}: {}", operation_name, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            connection_.reset();
        } catch (const pqxx::sql_error& e) {
            spdlog::error("SQL error during {}: {}", operation_name, e.what());
        }

        ++attempts;
        if (attempts >= max_retries) {
            spdlog::error("Max retry attempts reached for {}", operation_name);
            throw BootstrapError("pool source unavailable for " + operation_name);
        }

        double backoff_seconds = std::pow(2.0, attempts) * (1.0 + jitter(gen));
        spdlog::info("Retrying {} in {:.2f} seconds (attempt {}/{})",
                    operation_name, backoff_seconds, attempts + 1, max_retries);
        std::this_thread::sleep_for(std::chrono::milliseconds(
            static_cast<int>(backoff_seconds * 1000)));
    }
}

std::vector<Pool> PgPoolSource::fetch_pools(const std::string& chain) {
    return execute_with_retry([this, &chain]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& conn = get_connection();
        pqxx::read_transaction txn(conn);

        auto result = txn.exec_params(
            "SELECT id, buffer FROM " + config_.pools_table + " WHERE chain = $1",
            chain
        );

        std::vector<Pool> pools;
        pools.reserve(result.size());

        for (const auto& row : result) {
            auto id = row[0].as<std::string>();
            auto bytes = util::from_hex(row[1].as<std::string>());
            if (!bytes) {
                throw BootstrapError("pool " + id + " on " + chain + " has a malformed hex buffer");
            }

            auto pool = codec::decode_pool(*bytes);
            if (!pool) {
                throw BootstrapError("pool " + id + " on " + chain + " could not be decoded");
            }
            pools.push_back(std::move(*pool));
        }

        spdlog::debug("Fetched {} pool rows for {} from {}", pools.size(), chain, config_.pools_table);
        return pools;
    }, "fetch_pools(" + chain + ")");
}

bool PgPoolSource::check_health() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& conn = get_connection();
        pqxx::nontransaction txn(conn);
        txn.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Database health check failed: {}", e.what());
        return false;
    }
}

pqxx::connection& PgPoolSource::get_connection() {
    if (!connection_ || !connection_->is_open()) {
        connection_ = std::make_unique<pqxx::connection>(config_.db_conn_string);
        spdlog::info("Connected to pool database {}", connection_->dbname());
    }
    return *connection_;
}
