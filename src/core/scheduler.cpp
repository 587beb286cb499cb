// Fan-out scheduler implementation

#include "scheduler.h"
#include "comparison_task.h"
#include "outcome_channel.h"
#include "worker_pool.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>

FanoutScheduler::FanoutScheduler(const Prober& prober, const Options& opts)
    : prober_(prober), opts_(opts) {
    if (opts_.methods.empty()) {
        throw std::invalid_argument("FanoutScheduler needs at least one method");
    }
}

// Outcome for a comparison that threw instead of returning.
static ComparisonOutcome failed_outcome(const std::string& endpoint,
                                        const std::string& method,
                                        const AuthContext& context_a,
                                        const AuthContext& context_b,
                                        const std::string& error) {
    ComparisonOutcome outcome;
    outcome.kind = OutcomeKind::INCONCLUSIVE;
    outcome.endpoint = endpoint;
    outcome.method = method;
    outcome.label_a = context_a.label;
    outcome.label_b = context_b.label;
    outcome.probe_a = ProbeOutcome::inconclusive(error);
    return outcome;
}

size_t FanoutScheduler::worker_count(size_t tasks) const {
    if (opts_.concurrency == 0) {
        return tasks;
    }
    return std::min(opts_.concurrency, tasks);
}

size_t FanoutScheduler::run(const std::vector<std::string>& endpoints,
                            const AuthContext& context_a,
                            const AuthContext& context_b,
                            OutcomeSink& sink) const {
    const size_t total = endpoints.size() * opts_.methods.size();
    if (total == 0) {
        return 0;
    }

    OutcomeChannel channel;
    std::atomic<size_t> remaining(total);
    size_t delivered = 0;

    // The pool is declared last so its destructor joins the workers before
    // the channel and counter they reference go away.
    WorkerPool pool(worker_count(total));

    for (const auto& endpoint : endpoints) {
        for (const auto& method : opts_.methods) {
            pool.enqueue([&, endpoint, method] {
                ComparisonOutcome outcome;
                try {
                    outcome = compare_endpoint(prober_, endpoint, method, context_a, context_b);
                } catch (const std::exception& e) {
                    outcome = failed_outcome(endpoint, method, context_a, context_b, e.what());
                } catch (...) {
                    outcome = failed_outcome(endpoint, method, context_a, context_b, "unknown error");
                }
                channel.push(std::move(outcome));
                if (--remaining == 0) {
                    channel.close();
                }
            });
        }
    }

    ComparisonOutcome outcome;
    while (channel.pop(outcome)) {
        ++delivered;
        sink.on_outcome(outcome, delivered, total);
    }
    return delivered;
}
