#pragma once

/**
 * Font sizes supported by the displays. The value is the character height in
 * pixels.
 */
typedef enum FontSize { Size12 = 12, Size16 = 16, Size24 = 24 } FontSize;
