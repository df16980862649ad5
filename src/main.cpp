#include "NimbaApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        NimbaApp app;
        return app.run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
