#include "ballsim/core/debug.hpp"

// Initialize static members
int DebugStats::despawned = 0;
int DebugStats::came_to_rest = 0;
int DebugStats::collisions = 0;
int DebugStats::bounces = 0;
