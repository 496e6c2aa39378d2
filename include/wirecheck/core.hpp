#pragma once

/*
================================================================================
Wirecheck Core — Execution Engine
================================================================================

Entry point:

    wirecheck::core::Engine<Transport>

    execute(suite, dataset, RunContext)                -> RunResult
    execute_performance(plan, units, PerfContext, cb)  -> PerformanceResult

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

The engine runs on the calling thread and owns a bounded pool of worker
threads per phase:

    [1] Caller thread   plans the run, drives the load pattern, collates
    [N] Worker threads  resolve, send, retry, evaluate, emit samples

Workers block only inside Transport::send() and retry backoff. Results are
ingested through two mutex-protected points (the result collator and the
metrics aggregator), so completion order never affects report order.

-------------------------------------------------------------------------------
Transport Contract
-------------------------------------------------------------------------------

Any type satisfying transport::TransportConcept:

    Reply send(const Request&, std::chrono::milliseconds timeout);

It must be safe to call send() from several workers concurrently.
================================================================================
*/

#include "wirecheck/core/engine.hpp"
#include "wirecheck/core/util/parse.hpp"
