#include "app/LedgerwiseApp.hpp"

int main(int argc, char** argv) {
    ledgerwise::app::LedgerwiseApp app;
    return app.Run(argc, argv);
}
