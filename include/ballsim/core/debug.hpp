#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef ENABLE_DEBUG
#define ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

#define DEBUG_MSG(level, x) do { \
    if (ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

/**
 * @brief Per-tick counters for body lifecycle events
 *
 * Reset by the integrator at the start of each tick and printed with
 * DEBUG_MSG once the tick completes.
 */
class DebugStats {
public:
    static void reset() {
        despawned = 0;
        came_to_rest = 0;
        collisions = 0;
        bounces = 0;
    }

    static void countDespawn() { despawned++; }
    static void countRest() { came_to_rest++; }
    static void countCollisions(int n) { collisions += n; }
    static void countBounce() { bounces++; }

    static int getDespawned() { return despawned; }
    static int getCameToRest() { return came_to_rest; }
    static int getCollisions() { return collisions; }
    static int getBounces() { return bounces; }

    static void printTickStats() {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "Tick stats:\n"
            "  Despawned: " << despawned << "\n"
            "  Came to rest: " << came_to_rest << "\n"
            "  Body contacts: " << collisions << "\n"
            "  Wall bounces: " << bounces << "\n"
        );
    }

private:
    static int despawned;
    static int came_to_rest;
    static int collisions;
    static int bounces;
};
