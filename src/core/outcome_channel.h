#pragma once
#include <schema/comparison_outcome.h>
#include <condition_variable>
#include <deque>
#include <mutex>

// Unbounded many-producer / single-consumer queue of comparison outcomes.
// pop() blocks until an outcome is available or the channel is closed and
// drained; outcomes pushed before close() are always delivered.

class OutcomeChannel {
public:
    OutcomeChannel() : closed_(false) {}

    void push(ComparisonOutcome outcome);

    /// Mark the end of the stream. Later pushes are dropped.
    void close();

    /**
     * @brief Take the next outcome in arrival order
     * @param out Receives the outcome
     * @return false once the channel is closed and empty
     */
    bool pop(ComparisonOutcome& out);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ComparisonOutcome> queue_;
    bool closed_;
};
