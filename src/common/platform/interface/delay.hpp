#pragma once

/**
 * Abstraction over sleeping between ticks of the game loop. Tests plug in an
 * implementation that returns immediately.
 */
class DelayProvider
{
      public:
        virtual ~DelayProvider() {}
        virtual void delay_ms(int ms) = 0;
};
