#pragma once
#include <cstddef>
#include <cstdint>

/**
 * CENTRAL SYSTEM CONSTANTS
 * Single source of truth for all controller-engine configuration defaults
 *
 * IMPORTANT: Only modify values here - config structs pull their defaults from this file.
 */

namespace SystemConstants {

    // =============================================================================
    // COMMAND QUEUE
    // =============================================================================

    namespace Queue {
        constexpr size_t DEFAULT_CAPACITY = 128;               // Pending entries before backpressure
        constexpr int COMMAND_TIMEOUT_MS = 5000;               // Max wait for ok/error per command
    }

    // =============================================================================
    // CONNECTION TIMING
    // =============================================================================

    namespace Timing {
        constexpr int STATUS_POLL_INTERVAL_MS = 250;           // '?' status query period
        constexpr int CONNECT_TIMEOUT_MS = 5000;               // Transport open/connect limit
        constexpr int RECEIVE_WAIT_MS = 100;                   // Receive loop read slice
        constexpr int SEND_WAIT_MS = 50;                       // Send loop idle slice
    }

    // =============================================================================
    // SUBSCRIPTIONS
    // =============================================================================

    namespace Channels {
        constexpr size_t SUBSCRIBER_CAPACITY = 100;            // Items buffered per subscriber
    }

    // =============================================================================
    // TRANSPORTS
    // =============================================================================

    namespace Serial {
        constexpr int DEFAULT_BAUD_RATE = 115200;              // GRBL 1.1 default
    }

    namespace Telnet {
        constexpr uint16_t DEFAULT_PORT = 23;
    }

    // =============================================================================
    // PROTOCOL LIMITS
    // =============================================================================

    namespace Protocol {
        constexpr size_t MAX_RX_LINE_LENGTH = 256;             // Longest inbound line before framing error
        constexpr double MAX_LINE_NUMBER = 9999999;            // GRBL N-word limit (error:27)
        constexpr double MAX_COMMAND_CODE = 9999;              // G/M/T words above this are rejected
    }

    // =============================================================================
    // G-CODE GEOMETRY
    // =============================================================================

    namespace Geometry {
        constexpr double MM_PER_INCH = 25.4;
        constexpr double DEFAULT_ARC_TOLERANCE = 0.1;          // Max chord deviation [length unit]
        constexpr double POSITION_EPSILON = 1e-4;              // Coincident point threshold
        constexpr double ARC_ANGULAR_TRAVEL_EPSILON = 5e-7;    // Below this, start == end means full circle

        // IJK arc radius consistency (GRBL): error when |r_end - r_start| exceeds
        // ARC_RADIUS_ERROR_MIN and either ARC_RADIUS_ERROR_MAX or the relative limit
        constexpr double ARC_RADIUS_ERROR_MIN_MM = 0.005;
        constexpr double ARC_RADIUS_ERROR_MAX_MM = 0.5;
        constexpr double ARC_RADIUS_ERROR_RELATIVE = 0.001;

        constexpr size_t MAX_CHORDS_PER_ARC = 1000000;         // Guard against degenerate tolerances
    }

    // =============================================================================
    // REAL-TIME OVERRIDES
    // =============================================================================

    namespace Overrides {
        constexpr int DEFAULT_PERCENT = 100;
        constexpr int MIN_PERCENT = 10;                        // Feed and spindle lower bound
        constexpr int MAX_PERCENT = 200;                       // Feed and spindle upper bound
        constexpr int COARSE_STEP = 10;
        constexpr int FINE_STEP = 1;
    }

    // =============================================================================
    // UTILITY FUNCTIONS
    // =============================================================================

    namespace Utils {
        inline double inchToMm(double inches) {
            return inches * Geometry::MM_PER_INCH;
        }

        inline double mmToInch(double mm) {
            return mm / Geometry::MM_PER_INCH;
        }
    }

} // namespace SystemConstants
