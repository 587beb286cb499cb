#pragma once
#include "prober.h"
#include "auth_context.h"
#include <schema/comparison_outcome.h>
#include <string>
#include <vector>

// Fan-out of paired comparisons over every endpoint and method.
// Tasks run on a bounded worker pool; their outcomes are delivered in
// completion order to a single sink on the caller's thread, so the sink
// needs no locking of its own.

class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;

    /**
     * @brief Receive one comparison outcome
     * @param outcome Outcome of one (endpoint, method) pair
     * @param current Number of outcomes delivered so far, including this one
     * @param total Number of outcomes the run will deliver
     */
    virtual void on_outcome(const ComparisonOutcome& outcome, size_t current, size_t total) = 0;
};

class FanoutScheduler {
public:
    struct Options {
        size_t concurrency;                // Worker threads; 0 = one per task
        std::vector<std::string> methods;  // Methods compared per endpoint

        Options()
            : concurrency(20),
              methods({"GET", "POST"})
        {}
    };

    /**
     * @brief Create a scheduler over a shared prober
     * @param prober Prober used by every task; must be safe for concurrent use
     * @param opts Concurrency limit and methods
     */
    FanoutScheduler(const Prober& prober, const Options& opts = Options());

    /**
     * @brief Compare every endpoint under both contexts
     *
     * Returns only after every task has finished and every outcome has been
     * handed to the sink.
     *
     * @param endpoints Endpoint URLs
     * @param context_a First authentication context
     * @param context_b Second authentication context
     * @param sink Receives each outcome with the running count
     * @return Number of outcomes delivered (endpoints x methods)
     */
    size_t run(const std::vector<std::string>& endpoints,
               const AuthContext& context_a,
               const AuthContext& context_b,
               OutcomeSink& sink) const;

    /// Number of worker threads a run over `tasks` tasks would start.
    size_t worker_count(size_t tasks) const;

private:
    const Prober& prober_;
    Options opts_;
};
