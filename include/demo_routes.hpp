#pragma once

#include "connection_session.hpp"

class Stats;

// "/" -> 200, "/stats" -> counters, anything else -> 404.
RequestHandler make_demo_handler(const Stats& stats, int threads);
