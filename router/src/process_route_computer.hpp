#pragma once

#include "route_computer.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

// Spawns one swap_route_worker process per computation. The request goes to
// the worker's stdin, the response comes back on its stdout, and the process
// is reaped before compute() returns. At most max_workers processes are alive
// at once; extra callers wait for a free slot.
class ProcessRouteComputer : public RouteComputer {
public:
    ProcessRouteComputer(std::string worker_path, std::chrono::milliseconds timeout, int max_workers);

    std::vector<Route> compute(const Token& input,
                               const Token& output,
                               const std::vector<Pool>& pools,
                               const RouteSearchLimits& limits) override;

    int active_workers() const;

private:
    class WorkerSlot;

    std::string worker_path_;
    std::chrono::milliseconds timeout_;
    int max_workers_;

    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;
    int active_workers_ = 0;
};
