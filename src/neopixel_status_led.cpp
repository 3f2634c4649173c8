/**
 * @file neopixel_status_led.cpp
 * @brief VeeBridge status LED output - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "neopixel_status_led.h"
#include "log.h"

NeoPixelStatusLed::NeoPixelStatusLed()
    : _pixel(NEOPIXEL_COUNT, NEOPIXEL_PIN, NEO_GRB + NEO_KHZ800),
      _status(nullptr),
      _displayColor(0, 0, 0),
      _initialized(false) {
}

bool NeoPixelStatusLed::begin(const StatusLed* status) {
    _status = status;

    _pixel.begin();
    _pixel.setBrightness(LED_BRIGHTNESS);
    _pixel.clear();
    _pixel.show();

    _initialized = true;
    logPrint("[LED] Status LED initialized\n");
    return _initialized;
}

void NeoPixelStatusLed::update(uint32_t now) {
    if (!_initialized || !_status) {
        return;
    }

    RGBColor color = _status->colorAt(now);
    if (color != _displayColor) {
        applyColor(color);
    }
}

void NeoPixelStatusLed::applyColor(const RGBColor& color) {
    _displayColor = color;
    _pixel.setPixelColor(0, _pixel.Color(color.r, color.g, color.b));
    _pixel.show();
}
