#include <string>
#include <vector>

#include "app/NodeWastageApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    nodewastage::app::NodeWastageApp app;
    return app.Run(args);
}
