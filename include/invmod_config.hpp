#pragma once

// ===== Search defaults (override with -DINVMOD_...=X) =====

// Longest multiplier sequence a single search may commit
#ifndef INVMOD_MAX_ITERATIONS
#define INVMOD_MAX_ITERATIONS 200
#endif

// Earliest-odd-multiplier backtracks per search
#ifndef INVMOD_MAX_BACKTRACKS
#define INVMOD_MAX_BACKTRACKS 5
#endif

// Candidate evaluations per search (baseline, offsets and recomputations)
#ifndef INVMOD_MAX_NODES
#define INVMOD_MAX_NODES 2000
#endif

// Local offset window: k+1 .. k+W
#ifndef INVMOD_OFFSET_WINDOW
#define INVMOD_OFFSET_WINDOW 5
#endif

// 1 = k = floor(y/r) + 1 always, 0 = naive rule (k = y/r when r | y)
#ifndef INVMOD_CORRECTED_BASELINE
#define INVMOD_CORRECTED_BASELINE 1
#endif

// Moduli above 2^INVMOD_MAX_MODULUS_BITS are rejected so multipliers fit in 64 bits
#ifndef INVMOD_MAX_MODULUS_BITS
#define INVMOD_MAX_MODULUS_BITS 63
#endif
