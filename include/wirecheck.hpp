#pragma once

/*
===============================================================================
Wirecheck — Public API Entry Point
===============================================================================

Wirecheck is the execution engine of an API-testing and load-testing tool.
It consumes a parsed suite model and a transport implementation, and produces
ordered results, aggregated metrics and API coverage.

Suite-file parsing, the HTTP/gRPC clients and report rendering live outside
the engine. Symbols in the wirecheck::core namespace form the API contract.
===============================================================================
*/

#include <wirecheck/core.hpp>
