#include <iostream>

#include "engine/core/App.hpp"

int main()
{
    engine::core::App app;
    return app.Run(std::cin, std::cout) ? 0 : 1;
}
