#pragma once

/**
 * Colors are encoded using RGB565 (5 bits red, 6 bits green, 5 bits blue).
 * Display implementations are responsible for mapping them onto whatever
 * encoding their backend uses.
 */
typedef enum Color {
        White = 0xFFFF,
        Black = 0x0000,
        Red = 0xF800,
        Green = 0x07E0,
        DarkGreen = 0x03E0,
        Yellow = 0xFFE0,
        Gray = 0x8430,
        LGray = 0xC618,
        Pink = 0xFB56,
        Cream = 0xFF1A,
        LightBlue = 0x7D7C,
        // Background of the score bar at the top of the screen.
        Midnight = 0x2106,
} Color;
