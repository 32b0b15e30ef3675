#ifdef EMULATOR
#include "sfml_controller.hpp"
#include "../../logging.hpp"
#include <SFML/Window/Keyboard.hpp>

#define TAG "sfml_controller"

bool SfmlInputController::poll_for_input(Direction *input)
{
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Up)) {
                *input = Direction::UP;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Down)) {
                *input = Direction::DOWN;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Left)) {
                *input = Direction::LEFT;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Right)) {
                *input = Direction::RIGHT;
                return true;
        }
        return false;
}

void SfmlInputController::setup()
{
        LOG_DEBUG(TAG, "Arrow key controller ready");
}

bool SfmlActionInputController::poll_for_input(Action *input)
{
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Q)) {
                *input = Action::QUIT;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Space)) {
                *input = Action::START;
                return true;
        }
        if (sf::Keyboard::isKeyPressed(sf::Keyboard::Key::Escape)) {
                *input = Action::TO_MENU;
                return true;
        }
        return false;
}

void SfmlActionInputController::setup()
{
        LOG_DEBUG(TAG, "Action key controller ready");
}
#endif
