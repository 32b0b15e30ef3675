#pragma once
#ifdef EMULATOR
#include <SFML/Graphics/Font.hpp>
#include <optional>
#include <string>

/**
 * Loads the font used for all text rendered by the emulator. Returns
 * `std::nullopt` if the font file cannot be opened.
 */
std::optional<sf::Font> load_emulator_font(const std::string &path);
#endif
