#pragma once
#include "prober.h"
#include "auth_context.h"
#include <schema/comparison_outcome.h>
#include <string>

// Paired probing of one endpoint and method under two authentication
// contexts. Gathers data only; deciding whether the pair is a finding is
// left to the presentation side.

/**
 * @brief Check whether an endpoint is a static asset excluded from comparison
 *
 * Matches a case-sensitive `.js`, `.map` or `.svg` suffix on the URL path,
 * ignoring any query string or fragment.
 *
 * @param endpoint Endpoint URL
 * @return true if no request should be issued for it
 */
bool is_static_asset(const std::string& endpoint);

/**
 * @brief Probe an endpoint under both contexts and pair the results
 *
 * Context B is not probed when context A is inconclusive.
 *
 * @param prober Prober shared by all tasks
 * @param endpoint Endpoint URL
 * @param method HTTP method
 * @param context_a First authentication context
 * @param context_b Second authentication context
 * @return Skipped, inconclusive, or completed comparison outcome
 */
ComparisonOutcome compare_endpoint(const Prober& prober,
                                   const std::string& endpoint,
                                   const std::string& method,
                                   const AuthContext& context_a,
                                   const AuthContext& context_b);
