/**
 * @file status_led.cpp
 * @brief VeeBridge status LED - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "status_led.h"
#include <math.h>

StatusLed::StatusLed()
    : _pattern(LedPattern::BREATHE_SLOW),
      _baseColor(Colors::BLUE),
      _patternStartTime(0),
      _holdingFailure(false) {
}

bool StatusLed::begin(EventBroadcaster* events) {
    if (!events) {
        return false;
    }
    return events->subscribe(handleEvent, this, EVENT_MASK_STATE) != EventBroadcaster::INVALID_SUBSCRIBER;
}

void StatusLed::handleEvent(const BridgeEvent& event, void* context) {
    StatusLed* led = static_cast<StatusLed*>(context);
    const ConnectionTransition& t = event.transition;
    led->setState(t.toState, t.fromState == ConnectionState::FAILED, event.timestampMs);
}

// =============================================================================
// STATE MAPPING
// =============================================================================

LedPattern StatusLed::patternFor(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return LedPattern::BREATHE_SLOW;
        case ConnectionState::SCANNING: return LedPattern::BLINK_SCAN;
        case ConnectionState::CONNECTING: return LedPattern::BLINK_CONNECT;
        case ConnectionState::READY: return LedPattern::SOLID;
        case ConnectionState::DISCONNECTING: return LedPattern::BLINK_CONNECT;
        case ConnectionState::FAILED: return LedPattern::BLINK_URGENT;
        default: return LedPattern::OFF;
    }
}

RGBColor StatusLed::colorFor(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return Colors::BLUE;
        case ConnectionState::SCANNING: return Colors::CYAN;
        case ConnectionState::CONNECTING: return Colors::YELLOW;
        case ConnectionState::READY: return Colors::GREEN;
        case ConnectionState::DISCONNECTING: return Colors::ORANGE;
        case ConnectionState::FAILED: return Colors::RED;
        default: return Colors::OFF;
    }
}

void StatusLed::setState(ConnectionState state, bool afterFailure, uint32_t now) {
    _pattern = patternFor(state);
    _baseColor = colorFor(state);
    _patternStartTime = now;
    _holdingFailure = afterFailure && state == ConnectionState::DISCONNECTED;
}

// =============================================================================
// RENDERING
// =============================================================================

RGBColor StatusLed::colorAt(uint32_t now) const {
    uint32_t elapsed = now - _patternStartTime;

    if (_holdingFailure && elapsed < LED_FAILURE_HOLD_MS) {
        return blink(Colors::RED, elapsed, LED_BLINK_URGENT_MS);
    }

    switch (_pattern) {
        case LedPattern::SOLID:
            return _baseColor;

        case LedPattern::BREATHE_SLOW: {
            float brightness = breatheBrightness(elapsed, LED_BREATHE_SLOW_MS);
            return RGBColor(
                (uint8_t)(_baseColor.r * brightness),
                (uint8_t)(_baseColor.g * brightness),
                (uint8_t)(_baseColor.b * brightness)
            );
        }

        case LedPattern::BLINK_SCAN:
            return blink(_baseColor, elapsed, LED_BLINK_SCAN_MS);

        case LedPattern::BLINK_CONNECT:
            return blink(_baseColor, elapsed, LED_BLINK_CONNECT_MS);

        case LedPattern::BLINK_URGENT:
            return blink(_baseColor, elapsed, LED_BLINK_URGENT_MS);

        case LedPattern::OFF:
        default:
            return Colors::OFF;
    }
}

RGBColor StatusLed::blink(const RGBColor& color, uint32_t elapsed, uint32_t halfPeriodMs) {
    // Blink patterns start in the ON state
    return ((elapsed / halfPeriodMs) % 2 == 0) ? color : Colors::OFF;
}

float StatusLed::breatheBrightness(uint32_t elapsed, uint32_t cycleMs) {
    const float TWO_PI_F = 6.28318531f;
    float position = (float)(elapsed % cycleMs) / (float)cycleMs;

    // Position 0 = full brightness, position 0.5 = dimmest
    float brightness = (cosf(position * TWO_PI_F) + 1.0f) / 2.0f;

    // Never fully dark
    const float MIN_BRIGHTNESS = 0.1f;
    return MIN_BRIGHTNESS + brightness * (1.0f - MIN_BRIGHTNESS);
}
