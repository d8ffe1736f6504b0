#pragma once

#include "config.hpp"
#include "pool_source.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Reads the pool table maintained by the indexer. Each row holds one
// hex-encoded pool buffer for a chain.
class PgPoolSource : public PoolSource {
public:
    explicit PgPoolSource(const Config& config);
    ~PgPoolSource() override;

    std::vector<Pool> fetch_pools(const std::string& chain) override;

    // Check database connection health
    bool check_health();

private:
    pqxx::connection& get_connection();

    template<typename Func>
    auto execute_with_retry(Func query_func, const std::string& operation_name, int max_retries = 3)
        -> decltype(query_func());

    const Config& config_;
    std::mutex mutex_;
    std::unique_ptr<pqxx::connection> connection_;
};
