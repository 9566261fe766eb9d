#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();
    if (argc > 1)
    {
        ConfigGlobal::ConfigFile = argv[1];
    }

    ControlFlow Flow;
    return Flow.Run();
}
