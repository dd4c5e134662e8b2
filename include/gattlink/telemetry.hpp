#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(GATTLINK_ENABLE_TELEMETRY_L1)
    #define GL_TL1(expr) expr
#else
    #define GL_TL1(expr) ((void)0)
#endif
