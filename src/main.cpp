#include "app_runner.hpp"

int main(int argc, char** argv) {
    CAppRunner runner(argc, argv);
    return runner.Run();
}
