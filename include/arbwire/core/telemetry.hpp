#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(ARBWIRE_ENABLE_TELEMETRY_L1)
    #define AW_TL1(expr) expr
#else
    #define AW_TL1(expr) ((void)0)
#endif

#if defined(ARBWIRE_ENABLE_TELEMETRY_L2)
    #define AW_TL2(expr) expr
#else
    #define AW_TL2(expr) ((void)0)
#endif
