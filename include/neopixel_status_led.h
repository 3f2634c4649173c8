/**
 * @file neopixel_status_led.h
 * @brief VeeBridge status LED output - Onboard NeoPixel
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef NEOPIXEL_STATUS_LED_H
#define NEOPIXEL_STATUS_LED_H

#include <Arduino.h>
#include <Adafruit_NeoPixel.h>
#include "config.h"
#include "status_led.h"

/**
 * @brief Drives the single onboard NeoPixel from a StatusLed
 *
 * Usage:
 *   NeoPixelStatusLed pixel;
 *   pixel.begin(&statusLed);
 *   // in loop():
 *   pixel.update(millis());
 */
class NeoPixelStatusLed {
public:
    NeoPixelStatusLed();

    bool begin(const StatusLed* status);

    /**
     * @brief Push the current color if it changed
     */
    void update(uint32_t now);

private:
    Adafruit_NeoPixel _pixel;
    const StatusLed* _status;
    RGBColor _displayColor;
    bool _initialized;

    void applyColor(const RGBColor& color);
};

#endif // NEOPIXEL_STATUS_LED_H
