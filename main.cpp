#include "app/StreamSieveApp.hpp"

int main(int argc, char** argv) {
    streamsieve::app::StreamSieveApp app;
    return app.Run(argc, argv);
}
