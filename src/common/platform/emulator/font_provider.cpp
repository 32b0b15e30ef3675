#ifdef EMULATOR
#include "font_provider.hpp"
#include "../../logging.hpp"

#define TAG "font_provider"

std::optional<sf::Font> load_emulator_font(const std::string &path)
{
        sf::Font font;
        if (!font.openFromFile(path)) {
                LOG_ERROR(TAG, "Unable to load the font from %s", path.c_str());
                return std::nullopt;
        }
        LOG_DEBUG(TAG, "Loaded font %s", path.c_str());
        return font;
}
#endif
