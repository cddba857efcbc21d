#include "engine/Engine.hpp"

#include <string>

// Usage: neta [config.json]
int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    neta::Engine engine;
    if (!engine.init(configPath)) {
        return 1;
    }

    engine.run();
    engine.shutdown();
    return 0;
}
