/**
 * @file status_led.h
 * @brief VeeBridge status LED - Link state as color and pattern
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Follows STATE_CHANGED events and computes the color to show at any time.
 * Rendering to the onboard NeoPixel lives in NeoPixelStatusLed.
 *
 *   DISCONNECTED   blue, slow breathe
 *   SCANNING       cyan, blink
 *   CONNECTING     yellow, fast blink
 *   READY          green, solid
 *   DISCONNECTING  orange, fast blink
 *   FAILED         red, urgent blink (held after cleanup)
 */

#ifndef STATUS_LED_H
#define STATUS_LED_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "event_broadcaster.h"

// =============================================================================
// LED PATTERNS
// =============================================================================

enum class LedPattern : uint8_t {
    OFF = 0,
    SOLID,
    BREATHE_SLOW,
    BLINK_SCAN,
    BLINK_CONNECT,
    BLINK_URGENT
};

inline const char* ledPatternToString(LedPattern pattern) {
    switch (pattern) {
        case LedPattern::OFF: return "OFF";
        case LedPattern::SOLID: return "SOLID";
        case LedPattern::BREATHE_SLOW: return "BREATHE_SLOW";
        case LedPattern::BLINK_SCAN: return "BLINK_SCAN";
        case LedPattern::BLINK_CONNECT: return "BLINK_CONNECT";
        case LedPattern::BLINK_URGENT: return "BLINK_URGENT";
        default: return "UNKNOWN";
    }
}

namespace Colors {
    const RGBColor OFF(0, 0, 0);
    const RGBColor RED(255, 0, 0);
    const RGBColor GREEN(0, 255, 0);
    const RGBColor BLUE(0, 0, 255);
    const RGBColor CYAN(0, 255, 255);
    const RGBColor YELLOW(255, 255, 0);
    const RGBColor ORANGE(255, 128, 0);
}

// =============================================================================
// STATUS LED
// =============================================================================

class StatusLed {
public:
    StatusLed();

    /**
     * @brief Follow connection state changes from the broadcaster
     * @return false if no subscriber slot is free
     */
    bool begin(EventBroadcaster* events);

    /**
     * @brief Show a connection state starting at `now`
     * @param afterFailure DISCONNECTED reached through FAILED
     */
    void setState(ConnectionState state, bool afterFailure, uint32_t now);

    /**
     * @brief Color to display at `now` with the pattern applied
     */
    RGBColor colorAt(uint32_t now) const;

    LedPattern getPattern() const { return _pattern; }
    RGBColor getBaseColor() const { return _baseColor; }

    static LedPattern patternFor(ConnectionState state);
    static RGBColor colorFor(ConnectionState state);

private:
    LedPattern _pattern;
    RGBColor _baseColor;
    uint32_t _patternStartTime;
    bool _holdingFailure;

    static void handleEvent(const BridgeEvent& event, void* context);

    static RGBColor blink(const RGBColor& color, uint32_t elapsed, uint32_t halfPeriodMs);
    static float breatheBrightness(uint32_t elapsed, uint32_t cycleMs);
};

#endif // STATUS_LED_H
