#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: cheap per-field / per-chunk counters (codec::telemetry::Codec)
//
// Disabled levels compile to nothing: the expression is not evaluated.
//

#if defined(CHUNKWIRE_ENABLE_TELEMETRY_L1)
    #define CW_TL1(expr) expr
#else
    #define CW_TL1(expr) ((void)0)
#endif
