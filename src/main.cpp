#include "app/Application.hpp"

int main(int argc, char** argv)
{
    // Both the installer commands and the upgrader mode (--upgrade-internal) go through Application
    return Application{argc, argv}.run();
}
