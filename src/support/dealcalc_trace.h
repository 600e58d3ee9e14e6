// SPDX-License-Identifier: MIT
/**
 * @file dealcalc_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the dealcalc library
 *
 * The engine never prints. Everything worth observing (rate fallbacks,
 * omitted lease scenarios, vehicle match outcomes, lost trade-in tax credit)
 * is exposed as a static probe that can be enabled at runtime with bpftrace,
 * systemtap or perf.
 *
 * When tracing is disabled (default), probes compile to nothing.
 *
 * Example usage with bpftrace:
 *   # Every financing computation that fell back to the default rate
 *   sudo bpftrace -e 'usdt:./libdealcalc.so:dealcalc:rate_fallback { printf("term=%d\n", arg0); }'
 *
 *   # Trade-in credit that could not be applied
 *   sudo bpftrace -e 'usdt:./libdealcalc.so:dealcalc:trade_credit_lost { ... }'
 */

#ifndef DEALCALC_TRACE_H
#define DEALCALC_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all dealcalc probes
 */
#define DEALCALC_PROVIDER dealcalc

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define MODULE_FINANCING      1
#define MODULE_LEASE          2
#define MODULE_LEASE_GRID     3
#define MODULE_VEHICLE_MATCH  4
#define MODULE_INPUT_PARSE    5
#define MODULE_DEAL_QUOTE     6

/**
 * Reasons a lease scenario is left out of a result
 */
#define SCENARIO_SKIP_NO_RESIDUAL  1   ///< Residual percentage is 0 for the term
#define SCENARIO_SKIP_NO_RATE      2   ///< Plan has no rate for the term

/**
 * Vehicle matcher passes
 */
#define MATCH_PASS_BODY_STYLE  1
#define MATCH_PASS_TRIM        2
#define MATCH_PASS_MODEL_ONLY  3

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a computation begins
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., term)
 * @param param2: Module-specific parameter (e.g., km per year)
 * @param param3: Module-specific parameter
 */
#define DEALCALC_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(DEALCALC_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when a computation completes
 * @param module_id: Module identifier
 * @param count: Items produced (options, scenarios, grid rows)
 * @param final_metric: Headline value (e.g., best payment)
 */
#define DEALCALC_TRACE_ALGO_COMPLETE(module_id, count, final_metric) \
    DTRACE_PROBE3(DEALCALC_PROVIDER, algo_complete, module_id, count, final_metric)

/**
 * ============================================================================
 * Validation and Degradation Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param param1: Offending value
 * @param param2: Field index or threshold
 */
#define DEALCALC_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(DEALCALC_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a financing rate table has no entry and the fallback is used
 * @param term: Requested term in months
 * @param fallback_rate: Rate substituted (percent)
 */
#define DEALCALC_TRACE_RATE_FALLBACK(term, fallback_rate) \
    DTRACE_PROBE2(DEALCALC_PROVIDER, rate_fallback, term, fallback_rate)

/**
 * Fired when a lease scenario is omitted
 * @param term: Lease term in months
 * @param km: Annual mileage tier
 * @param reason: SCENARIO_SKIP_* constant
 */
#define DEALCALC_TRACE_SCENARIO_SKIPPED(term, km, reason) \
    DTRACE_PROBE3(DEALCALC_PROVIDER, scenario_skipped, term, km, reason)

/**
 * ============================================================================
 * Module-Specific Probes
 * ============================================================================
 */

/**
 * Fired after each vehicle matcher pass
 * @param pass: MATCH_PASS_* constant
 * @param found: 1 if a record matched, 0 otherwise
 * @param index: Position of the matched record (0 if none)
 */
#define DEALCALC_TRACE_MATCH_RESULT(pass, found, index) \
    DTRACE_PROBE3(DEALCALC_PROVIDER, match_result, pass, found, index)

/**
 * Fired when part of the trade-in tax credit exceeds the payment taxes
 * @param term: Lease term in months
 * @param potential: Credit available per period
 * @param lost: Portion that could not be applied
 */
#define DEALCALC_TRACE_TRADE_CREDIT_LOST(term, potential, lost) \
    DTRACE_PROBE3(DEALCALC_PROVIDER, trade_credit_lost, term, potential, lost)

/**
 * Fired with the winning row of a lease grid search
 * @param term: Winning term
 * @param km: Winning mileage tier
 * @param plan: 0 = standard, 1 = alternative
 * @param monthly: Winning post-tax monthly payment
 */
#define DEALCALC_TRACE_GRID_BEST(term, km, plan, monthly) \
    DTRACE_PROBE4(DEALCALC_PROVIDER, grid_best, term, km, plan, monthly)

#endif // DEALCALC_TRACE_H
