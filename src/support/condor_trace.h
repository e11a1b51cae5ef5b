// SPDX-License-Identifier: MIT
/**
 * @file condor_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the condor library
 *
 * The analytics core never writes log lines. Instead it exposes static
 * tracing points that can be enabled at runtime with bpftrace, systemtap
 * or perf. When no tracer is attached each probe is a single NOP.
 *
 * Example usage with bpftrace:
 *   # Watch every analysis request and its outcome
 *   sudo bpftrace -e 'usdt:./libcondor.so:condor:analysis_* { ... }'
 *
 *   # Count validation failures per module
 *   sudo bpftrace -e 'usdt:./libcondor.so:condor:validation_error { @[arg0] = count(); }'
 */

#ifndef CONDOR_TRACE_H
#define CONDOR_TRACE_H

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
#define DTRACE_PROBE6(provider, probe, arg1, arg2, arg3, arg4, arg5, arg6) do {} while(0)
#endif

/**
 * Provider name for all condor library probes
 */
#define CONDOR_PROVIDER condor

/**
 * Module identifiers, passed as the first argument of the shared probes
 */
#define CONDOR_MODULE_STRIKE_OPTIMIZER 1
#define CONDOR_MODULE_GREEKS           2
#define CONDOR_MODULE_ANALYZER         3

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier (CONDOR_MODULE_* constant)
 * @param error_code: Error code (ValidationErrorCode or AnalysisErrorCode)
 * @param value: Offending parameter value
 */
#define CONDOR_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(CONDOR_PROVIDER, validation_error, module_id, error_code, value)

/**
 * ============================================================================
 * Analysis Probes
 * ============================================================================
 */

/**
 * Fired when a full condor analysis begins
 * @param spot: Underlying price used for the analysis
 * @param days: Whole days to expiration
 * @param volatility: Implied volatility
 * @param contracts: Number of contracts
 */
#define CONDOR_TRACE_ANALYSIS_START(spot, days, volatility, contracts) \
    DTRACE_PROBE4(CONDOR_PROVIDER, analysis_start, spot, days, volatility, contracts)

/**
 * Fired when a condor analysis completes
 * @param net_credit: Net credit received in dollars
 * @param max_loss: Maximum loss in dollars
 * @param pop: Probability of profit in percent
 * @param score: Strategy score (0-100)
 */
#define CONDOR_TRACE_ANALYSIS_COMPLETE(net_credit, max_loss, pop, score) \
    DTRACE_PROBE4(CONDOR_PROVIDER, analysis_complete, net_credit, max_loss, pop, score)

/**
 * ============================================================================
 * Strike Optimizer Probes
 * ============================================================================
 */

/**
 * Fired when strikes are derived for a target probability
 * @param spot: Underlying price
 * @param target_probability: Requested probability of profit
 * @param z_score: Two-sided z-score of the short strikes
 * @param wing_width: Distance between short and long strikes
 */
#define CONDOR_TRACE_OPTIMIZER_SOLVE(spot, target_probability, z_score, wing_width) \
    DTRACE_PROBE4(CONDOR_PROVIDER, optimizer_solve, spot, target_probability, z_score, wing_width)

#endif // CONDOR_TRACE_H
